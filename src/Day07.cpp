#include "../include/Day07.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <string>

#include "../include/IO.hpp"

namespace Day07 {

uint8_t cardValue(char c) {
  switch (c) {
    case 'A': return 14;
    case 'K': return 13;
    case 'Q': return 12;
    case 'J': return 11;
    case 'T': return 10;
    default:
      if (c >= '2' && c <= '9') return static_cast<uint8_t>(c - '0');
  }
  throw std::runtime_error(std::string("Invalid card: ") + c);
}

HandType classify(const std::array<uint8_t, 5>& cards) {
  std::array<int, 15> counts{};
  int jokers = 0;
  for (uint8_t c : cards) {
    if (c == kJoker)
      ++jokers;
    else
      ++counts[c];
  }

  // Group sizes, largest first
  std::sort(counts.begin(), counts.end(), std::greater<int>());
  const int first = counts[0] + jokers;
  const int second = counts[1];

  switch (first) {
    case 5: return HandType::FiveOfKind;
    case 4: return HandType::FourOfKind;
    case 3: return second == 2 ? HandType::FullHouse : HandType::ThreeOfKind;
    case 2: return second == 2 ? HandType::TwoPair : HandType::OnePair;
    default: return HandType::HighCard;
  }
}

Hand::Hand(const std::array<uint8_t, 5>& cards, uint64_t bid)
    : cards_(cards), type_(classify(cards)), bid_(bid) {}

Hand Hand::parse(std::string_view line) {
  std::vector<std::string_view> fields = IO::words(line);
  if (fields.size() != 2 || fields[0].size() != 5)
    throw std::runtime_error("Invalid hand: " + std::string(line));

  std::array<uint8_t, 5> cards{};
  for (size_t i = 0; i < cards.size(); ++i) cards[i] = cardValue(fields[0][i]);
  return Hand(cards, IO::parseInt<uint64_t>(fields[1]));
}

Hand Hand::withJokers() const {
  std::array<uint8_t, 5> cards = cards_;
  for (auto& c : cards)
    if (c == cardValue('J')) c = kJoker;
  return Hand(cards, bid_);
}

HandType Hand::type() const { return type_; }

uint64_t Hand::bid() const { return bid_; }

bool Hand::operator<(const Hand& other) const {
  if (type_ != other.type_) return type_ < other.type_;
  return cards_ < other.cards_;
}

std::vector<Hand> parseInput(std::string_view input) {
  std::vector<Hand> hands;
  for (std::string_view line : IO::lines(input))
    if (!IO::trim(line).empty()) hands.push_back(Hand::parse(line));
  return hands;
}

int64_t totalWinnings(std::vector<Hand> hands) {
  std::sort(hands.begin(), hands.end());

  int64_t total = 0;
  for (size_t i = 0; i < hands.size(); ++i)
    total += static_cast<int64_t>(i + 1) * static_cast<int64_t>(hands[i].bid());
  return total;
}

std::vector<Hand> intoJokerHands(const std::vector<Hand>& hands) {
  std::vector<Hand> out;
  out.reserve(hands.size());
  for (const auto& h : hands) out.push_back(h.withJokers());
  return out;
}

std::vector<Model::Answer> Solver::solve(const std::string& input) {
  std::vector<Hand> hands = parseInput(input);
  return {
      {1, "Total winnings", totalWinnings(hands)},
      {2, "Total winnings", totalWinnings(intoJokerHands(hands))},
  };
}

};  // namespace Day07
