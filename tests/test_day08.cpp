#include <cassert>
#include <iostream>
#include <stdexcept>

#include "../include/Day08.hpp"

static const char* kDirect =
    "RL\n"
    "\n"
    "AAA = (BBB, CCC)\n"
    "BBB = (DDD, EEE)\n"
    "CCC = (ZZZ, GGG)\n"
    "DDD = (DDD, DDD)\n"
    "EEE = (EEE, EEE)\n"
    "GGG = (GGG, GGG)\n"
    "ZZZ = (ZZZ, ZZZ)\n";

static const char* kRepeating =
    "LLR\n"
    "\n"
    "AAA = (BBB, BBB)\n"
    "BBB = (AAA, ZZZ)\n"
    "ZZZ = (ZZZ, ZZZ)\n";

static const char* kGhosts =
    "LR\n"
    "\n"
    "11A = (11B, XXX)\n"
    "11B = (XXX, 11Z)\n"
    "11Z = (11B, XXX)\n"
    "22A = (22B, XXX)\n"
    "22B = (22C, 22C)\n"
    "22C = (22Z, 22Z)\n"
    "22Z = (22B, 22B)\n"
    "XXX = (XXX, XXX)\n";

static void test_parse() {
  Day08::Network net = Day08::parseInput(kDirect);
  assert(net.directions == "RL");
  assert(net.nodes.size() == 7);
  assert(net.nodes.at("AAA").first == "BBB");
  assert(net.nodes.at("AAA").second == "CCC");
  assert(net.starts.size() == 1 && net.starts[0] == "AAA");
}

static void test_part1() {
  assert(Day08::solvePart1(Day08::parseInput(kDirect)) == 2);
  // directions repeat until ZZZ is reached
  assert(Day08::solvePart1(Day08::parseInput(kRepeating)) == 6);
}

static void test_part2() {
  Day08::Network net = Day08::parseInput(kGhosts);
  assert(net.starts.size() == 2);
  assert(Day08::solvePart2(net) == 6);
}

static void test_lcm() {
  assert(Day08::lcmOf({2, 3}) == 6);
  assert(Day08::lcmOf({4, 6, 10}) == 60);
  assert(Day08::lcmOf({7}) == 7);
}

static void test_unknown_node() {
  Day08::Network net = Day08::parseInput(
      "L\n"
      "\n"
      "AAA = (QQQ, ZZZ)\n");
  bool threw = false;
  try {
    Day08::solvePart1(net);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

static void test_bad_directions() {
  bool threw = false;
  try {
    Day08::parseInput("LXR\n\nAAA = (AAA, AAA)\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_parse();
  test_part1();
  test_part2();
  test_lcm();
  test_unknown_node();
  test_bad_directions();

  std::cout << "[OK] Day 08 tests passed\n";
  return 0;
}
