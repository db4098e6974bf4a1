#ifndef DAY04_HPP
#define DAY04_HPP

#include <cstdint>
#include <string_view>
#include <vector>

#include "Puzzle.hpp"

// Scratchcards
namespace Day04 {
struct Scratchcard {
  size_t id{};
  uint32_t matches{};  // numbers both winning and held

  // 2^(matches-1), or 0 without matches
  int64_t points() const;
};

// "Card 1: 41 48 83 86 17 | 83 86  6 31 17  9 48 53"
std::vector<Scratchcard> parseInput(std::string_view input);

int64_t totalPoints(const std::vector<Scratchcard>& cards);

// Each card wins one copy of each of the next `matches` cards; returns the
// final number of cards held
int64_t processCardPile(const std::vector<Scratchcard>& cards);

class Solver : public Puzzle::Solver {
 public:
  int day() const override { return 4; }
  std::vector<Model::Answer> solve(const std::string& input) override;
};
};  // namespace Day04

#endif
