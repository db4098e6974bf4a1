#ifndef DAY01_HPP
#define DAY01_HPP

#include <cstdint>
#include <string_view>
#include <utility>

#include "Puzzle.hpp"

// Trebuchet calibration: first and last digit of every line
namespace Day01 {
using Digits = std::pair<int, int>;
using DigitFn = Digits (*)(std::string_view line);

// Only ASCII digits count
Digits digitsPlain(std::string_view line);

// ASCII digits and the spelled words one..nine (overlaps allowed)
Digits digitsSpelled(std::string_view line);

// Sum of first * 10 + last over all lines
int64_t totalCalibration(std::string_view input, DigitFn fn);

class Solver : public Puzzle::Solver {
 public:
  int day() const override { return 1; }
  std::vector<Model::Answer> solve(const std::string& input) override;
};
};  // namespace Day01

#endif
