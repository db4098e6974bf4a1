#include "../include/Day01.hpp"

#include <array>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

#include "../include/IO.hpp"

namespace {
constexpr std::array<std::string_view, 9> kWords = {
    "one", "two", "three", "four", "five", "six", "seven", "eight", "nine"};

std::optional<int> digitAt(std::string_view s, bool spelled) {
  if (std::isdigit(static_cast<unsigned char>(s.front())))
    return s.front() - '0';
  if (!spelled) return std::nullopt;
  for (size_t i = 0; i < kWords.size(); ++i)
    if (s.substr(0, kWords[i].size()) == kWords[i])
      return static_cast<int>(i) + 1;
  return std::nullopt;
}

Day01::Digits scan(std::string_view line, bool spelled) {
  std::optional<int> first, last;

  // search from left
  for (size_t i = 0; i < line.size() && !first; ++i)
    first = digitAt(line.substr(i), spelled);
  // search from right
  for (size_t i = line.size(); i > 0 && !last; --i)
    last = digitAt(line.substr(i - 1), spelled);

  if (!first || !last)
    throw std::runtime_error("No calibration digit in line: " +
                             std::string(line));
  return {*first, *last};
}
}  // namespace

namespace Day01 {

Digits digitsPlain(std::string_view line) { return scan(line, false); }

Digits digitsSpelled(std::string_view line) { return scan(line, true); }

int64_t totalCalibration(std::string_view input, DigitFn fn) {
  int64_t sum = 0;
  for (std::string_view line : IO::lines(input)) {
    if (IO::trim(line).empty()) continue;
    Digits d = fn(line);
    sum += d.first * 10 + d.second;
  }
  return sum;
}

std::vector<Model::Answer> Solver::solve(const std::string& input) {
  return {
      {1, "Total calibration value", totalCalibration(input, digitsPlain)},
      {2, "Total calibration value", totalCalibration(input, digitsSpelled)},
  };
}

};  // namespace Day01
