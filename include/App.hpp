#ifndef APP_HPP
#define APP_HPP

#include <cstddef>
#include <iostream>
#include <memory>
#include <string>

namespace IO {
class Endpoint;
};
namespace Puzzle {
class Solver;
};

namespace App {

constexpr int kFirstDay = 1;
constexpr int kLastDay = 10;

// Global configuration setting for the program
struct Config {
  int day{0};
  std::string inputDir{"inputs"};
  // Threads for the day 5 search, 0 = one per core
  std::size_t poolSize{0};
  // Day 5 part 2: "default" / "bruteforce" or "ranges"
  std::string methodUsed{"default"};
  // Print the solve time after the answers
  bool timing{false};

  Config() = default;
  explicit Config(int d, const std::string& dir = "inputs")
      : day(d), inputDir(dir) {}
};

enum class ArgStatus { Ok, Missing, Invalid };

// advent <day> [-i dir] [-j threads] [-m method] [-t]
ArgStatus parseArgs(int argc, const char* const* argv, Config& out);

// "<dir>/day05"
std::string inputPath(const Config& cfg);

// Build the solver for a day, nullptr if the day is not implemented
std::unique_ptr<Puzzle::Solver> makeSolver(const Config& cfg);

// Read the day's input, solve it and write the answers
class Coordinator {
 private:
  std::unique_ptr<IO::Endpoint> ioEndpoint;
  std::unique_ptr<Puzzle::Solver> solver;
  Config config;

 public:
  explicit Coordinator(const Config& cfg, std::ostream& out = std::cout);
  ~Coordinator();

  // Returns false (after printing a message) for an unknown day. Throws on
  // missing or malformed input.
  bool run();
};

}  // namespace App

#endif
