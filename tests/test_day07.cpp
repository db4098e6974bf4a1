#include <array>
#include <cassert>
#include <iostream>
#include <stdexcept>

#include "../include/Day07.hpp"

using Day07::Hand;
using Day07::HandType;

static const char* kExample =
    "32T3K 765\n"
    "T55J5 684\n"
    "KK677 28\n"
    "KTJJT 220\n"
    "QQQJA 483\n";

static HandType typeOf(const char* cards) {
  return Hand::parse(std::string(cards) + " 1").type();
}

static void test_hand_types() {
  assert(typeOf("AAAAA") == HandType::FiveOfKind);
  assert(typeOf("AA8AA") == HandType::FourOfKind);
  assert(typeOf("23332") == HandType::FullHouse);
  assert(typeOf("TTT98") == HandType::ThreeOfKind);
  assert(typeOf("23432") == HandType::TwoPair);
  assert(typeOf("A23A4") == HandType::OnePair);
  assert(typeOf("23456") == HandType::HighCard);
}

static void test_joker_types() {
  auto jokerType = [](const char* cards) {
    return Hand::parse(std::string(cards) + " 1").withJokers().type();
  };
  assert(jokerType("QJJQ2") == HandType::FourOfKind);
  assert(jokerType("T55J5") == HandType::FourOfKind);
  assert(jokerType("KTJJT") == HandType::FourOfKind);
  assert(jokerType("JJJJJ") == HandType::FiveOfKind);
  assert(jokerType("2345J") == HandType::OnePair);
  assert(jokerType("2245J") == HandType::ThreeOfKind);
  assert(jokerType("2233J") == HandType::FullHouse);
  assert(jokerType("KK677") == HandType::TwoPair);
}

static void test_tie_break_order() {
  // same type, first differing card decides
  assert(Hand::parse("2AAAA 1") < Hand::parse("33332 1"));
  assert(Hand::parse("KTJJT 1") < Hand::parse("KK677 1"));
  // a joker is weaker than a 2
  assert(Hand::parse("JKKK2 1").withJokers() < Hand::parse("QQQQ2 1").withJokers());
}

static void test_example() {
  auto hands = Day07::parseInput(kExample);

  // part 1
  assert(Day07::totalWinnings(hands) == 6440);

  // part 2
  assert(Day07::totalWinnings(Day07::intoJokerHands(hands)) == 5905);
}

static void test_bad_card() {
  bool threw = false;
  try {
    Hand::parse("12345 7");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_hand_types();
  test_joker_types();
  test_tie_break_order();
  test_example();
  test_bad_card();

  std::cout << "[OK] Day 07 tests passed\n";
  return 0;
}
