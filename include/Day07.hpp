#ifndef DAY07_HPP
#define DAY07_HPP

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "Puzzle.hpp"

// Camel Cards
namespace Day07 {
enum class HandType : uint8_t {
  HighCard,
  OnePair,
  TwoPair,
  ThreeOfKind,
  FullHouse,
  FourOfKind,
  FiveOfKind,
};

// Card strength: 2..9 as is, T=10, J=11, Q=12, K=13, A=14. A joker is 1.
constexpr uint8_t kJoker = 1;
uint8_t cardValue(char c);

// Best type the cards can form; jokers join the largest group
HandType classify(const std::array<uint8_t, 5>& cards);

class Hand {
 private:
  std::array<uint8_t, 5> cards_{};
  HandType type_{HandType::HighCard};
  uint64_t bid_{};

 public:
  Hand(const std::array<uint8_t, 5>& cards, uint64_t bid);

  // "32T3K 765"
  static Hand parse(std::string_view line);

  // Same hand with every J turned into a joker
  Hand withJokers() const;

  HandType type() const;
  uint64_t bid() const;

  // Type first, then card by card
  bool operator<(const Hand& other) const;
};

std::vector<Hand> parseInput(std::string_view input);

// Sum of rank * bid, weakest hand has rank 1
int64_t totalWinnings(std::vector<Hand> hands);

std::vector<Hand> intoJokerHands(const std::vector<Hand>& hands);

class Solver : public Puzzle::Solver {
 public:
  int day() const override { return 7; }
  std::vector<Model::Answer> solve(const std::string& input) override;
};
};  // namespace Day07

#endif
