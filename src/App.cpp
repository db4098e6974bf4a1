#include "../include/App.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <stdexcept>

#include "../include/Day01.hpp"
#include "../include/Day02.hpp"
#include "../include/Day03.hpp"
#include "../include/Day04.hpp"
#include "../include/Day05.hpp"
#include "../include/Day06.hpp"
#include "../include/Day07.hpp"
#include "../include/Day08.hpp"
#include "../include/Day09.hpp"
#include "../include/Day10.hpp"
#include "../include/IO.hpp"
#include "../include/Worker.hpp"

namespace {
bool parseNumberArg(const char* s, long long& out) {
  try {
    out = IO::parseInt<long long>(s);
    return true;
  } catch (const std::runtime_error&) {
    return false;
  }
}
}  // namespace

namespace App {

ArgStatus parseArgs(int argc, const char* const* argv, Config& out) {
  bool haveDay = false;

  for (int i = 1; i < argc; i++) {
    long long n = 0;
    if (strcmp(argv[i], "-i") == 0 && i + 1 < argc) {
      out.inputDir = argv[++i];
    } else if (strcmp(argv[i], "-j") == 0 && i + 1 < argc) {
      if (!parseNumberArg(argv[++i], n) || n < 0) return ArgStatus::Invalid;
      out.poolSize = static_cast<std::size_t>(n);
    } else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
      out.methodUsed = argv[++i];
    } else if (strcmp(argv[i], "-t") == 0) {
      out.timing = true;
    } else if (!haveDay) {
      if (!parseNumberArg(argv[i], n) || n < kFirstDay || n > kLastDay)
        return ArgStatus::Invalid;
      out.day = static_cast<int>(n);
      haveDay = true;
    } else {
      return ArgStatus::Invalid;
    }
  }

  return haveDay ? ArgStatus::Ok : ArgStatus::Missing;
}

std::string inputPath(const Config& cfg) {
  char name[16];
  std::snprintf(name, sizeof(name), "day%02d", cfg.day);
  return cfg.inputDir + "/" + name;
}

std::unique_ptr<Puzzle::Solver> makeSolver(const Config& cfg) {
  switch (cfg.day) {
    case 1: return std::make_unique<Day01::Solver>();
    case 2: return std::make_unique<Day02::Solver>();
    case 3: return std::make_unique<Day03::Solver>();
    case 4: return std::make_unique<Day04::Solver>();
    case 5:
      // Only part 2 is parallel; the pool is created per search
      return std::make_unique<Day05::Solver>(
          std::make_unique<Worker::ThreadWorker>(cfg.poolSize),
          cfg.methodUsed);
    case 6: return std::make_unique<Day06::Solver>();
    case 7: return std::make_unique<Day07::Solver>();
    case 8: return std::make_unique<Day08::Solver>();
    case 9: return std::make_unique<Day09::Solver>();
    case 10: return std::make_unique<Day10::Solver>();
    default: return nullptr;
  }
}

Coordinator::Coordinator(const Config& cfg, std::ostream& out)
    : ioEndpoint(std::make_unique<IO::Endpoint>(out)),
      solver(makeSolver(cfg)),
      config(cfg) {}

Coordinator::~Coordinator() = default;

bool Coordinator::run() {
  if (!solver) {
    ioEndpoint->note("Invalid input argument.");
    ioEndpoint->flush();
    return false;
  }

  const std::string input = IO::readFile(inputPath(config));

  const auto start = std::chrono::steady_clock::now();
  std::vector<Model::Answer> answers = solver->solve(input);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  ioEndpoint->write(answers);
  if (config.timing)
    ioEndpoint->note("Elapsed: " + std::to_string(elapsed.count()) + " ms");
  ioEndpoint->flush();
  return true;
}

}  // namespace App
