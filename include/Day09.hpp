#ifndef DAY09_HPP
#define DAY09_HPP

#include <cstdint>
#include <string_view>
#include <vector>

#include "Puzzle.hpp"

// Mirage Maintenance
namespace Day09 {
using History = std::vector<int64_t>;

std::vector<History> parseInput(std::string_view input);

// Pairwise differences, one element shorter
History differences(const History& data);

// Next value of the sequence
int64_t extrapolateForward(const History& data);

// Value before the first one
int64_t extrapolateBackward(const History& data);

int64_t sumExtrapolated(const std::vector<History>& histories,
                        int64_t (*fn)(const History&));

class Solver : public Puzzle::Solver {
 public:
  int day() const override { return 9; }
  std::vector<Model::Answer> solve(const std::string& input) override;
};
};  // namespace Day09

#endif
