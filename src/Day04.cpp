#include "../include/Day04.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "../include/IO.hpp"

namespace Day04 {

int64_t Scratchcard::points() const {
  return matches > 0 ? int64_t{1} << (matches - 1) : 0;
}

std::vector<Scratchcard> parseInput(std::string_view input) {
  std::vector<Scratchcard> cards;

  for (std::string_view line : IO::lines(input)) {
    if (IO::trim(line).empty()) continue;

    std::vector<std::string_view> fields =
        IO::split(IO::stripPrefix(line, "Card"), ":|");
    if (fields.size() != 3)
      throw std::runtime_error("Invalid card: " + std::string(line));

    Scratchcard card;
    card.id = IO::parseInt<size_t>(fields[0]);

    std::vector<uint32_t> winning = IO::parseNumbers<uint32_t>(fields[1]);
    std::unordered_set<uint32_t> win(winning.begin(), winning.end());
    std::unordered_set<uint32_t> have;
    for (uint32_t n : IO::parseNumbers<uint32_t>(fields[2]))
      if (win.count(n) && have.insert(n).second) ++card.matches;

    cards.push_back(card);
  }
  return cards;
}

int64_t totalPoints(const std::vector<Scratchcard>& cards) {
  int64_t sum = 0;
  for (const auto& c : cards) sum += c.points();
  return sum;
}

int64_t processCardPile(const std::vector<Scratchcard>& cards) {
  std::vector<int64_t> pile(cards.size(), 1);

  for (size_t i = 0; i < cards.size(); ++i) {
    // copies never run past the end of the table
    const size_t last = std::min(cards.size(), i + 1 + cards[i].matches);
    for (size_t j = i + 1; j < last; ++j) pile[j] += pile[i];
  }

  int64_t total = 0;
  for (int64_t n : pile) total += n;
  return total;
}

std::vector<Model::Answer> Solver::solve(const std::string& input) {
  std::vector<Scratchcard> cards = parseInput(input);
  return {
      {1, "Total points", totalPoints(cards)},
      {2, "Total cards", processCardPile(cards)},
  };
}

};  // namespace Day04
