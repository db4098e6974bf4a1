#include <cassert>
#include <iostream>

#include "../include/Day04.hpp"

static const char* kExample =
    "Card 1: 41 48 83 86 17 | 83 86  6 31 17  9 48 53\n"
    "Card 2: 13 32 20 16 61 | 61 30 68 82 17 32 24 19\n"
    "Card 3:  1 21 53 59 44 | 69 82 63 72 16 21 14  1\n"
    "Card 4: 41 92 73 84 69 | 59 84 76 51 58  5 54 83\n"
    "Card 5: 87 83 26 28 32 | 88 30 70 12 93 22 82 36\n"
    "Card 6: 31 18 13 56 72 | 74 77 10 23 35 67 36 11\n";

static void test_example() {
  auto cards = Day04::parseInput(kExample);
  assert(cards.size() == 6);

  // part 1
  assert(cards[0].points() == 8);
  assert(cards[1].points() == 2);
  assert(cards[2].points() == 2);
  assert(cards[3].points() == 1);
  assert(cards[4].points() == 0);
  assert(cards[5].points() == 0);
  assert(Day04::totalPoints(cards) == 13);

  // part 2
  assert(Day04::processCardPile(cards) == 30);
}

static void test_card_ids() {
  auto cards = Day04::parseInput("Card   1: 1 | 1\nCard  12: 2 | 3\n");
  assert(cards[0].id == 1 && cards[0].matches == 1);
  assert(cards[1].id == 12 && cards[1].matches == 0);
}

static void test_copies_stop_at_last_card() {
  // the last card cannot win copies past the end of the table
  auto cards = Day04::parseInput("Card 1: 5 | 6\nCard 2: 1 2 | 1 2\n");
  assert(Day04::processCardPile(cards) == 2);
}

int main() {
  test_example();
  test_card_ids();
  test_copies_stop_at_last_card();

  std::cout << "[OK] Day 04 tests passed\n";
  return 0;
}
