#ifndef DAY06_HPP
#define DAY06_HPP

#include <cstdint>
#include <string_view>
#include <vector>

#include "Puzzle.hpp"

// Wait For It
namespace Day06 {
struct Race {
  uint64_t time{};
  uint64_t distance{};
};

// "Time:      7  15   30"
// "Distance:  9  40  200"
std::vector<Race> parseInput(std::string_view input);

// Same input with the spaces between digits removed: one race
Race parseJoined(std::string_view input);

// Number of whole hold times h with h * (T - h) > D.
//
// The boundaries are the roots of h^2 - T*h + D = 0:
//   h = (T -+ sqrt(T^2 - 4D)) / 2
// Winning holds lie strictly between them, so the lower root is moved up by
// one before flooring and the upper root down by one before ceiling. This
// keeps exact roots outside the interval.
int64_t countWays(const Race& race);

// Exhaustive count over every hold time
int64_t countWaysBruteForce(const Race& race);

int64_t productOfWays(const std::vector<Race>& races);

class Solver : public Puzzle::Solver {
 public:
  int day() const override { return 6; }
  std::vector<Model::Answer> solve(const std::string& input) override;
};
};  // namespace Day06

#endif
