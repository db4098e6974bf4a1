#include <cassert>
#include <iostream>

#include "../include/Day06.hpp"

static const char* kExample =
    "Time:      7  15   30\n"
    "Distance:  9  40  200\n";

static void test_example() {
  auto races = Day06::parseInput(kExample);
  assert(races.size() == 3);

  assert(Day06::countWays(races[0]) == 4);
  assert(Day06::countWays(races[1]) == 8);
  // exact roots (10 and 20) do not beat the record
  assert(Day06::countWays(races[2]) == 9);
  assert(Day06::productOfWays(races) == 288);

  Day06::Race joined = Day06::parseJoined(kExample);
  assert(joined.time == 71530 && joined.distance == 940200);
  assert(Day06::countWays(joined) == 71503);
}

static void test_closed_form_matches_brute_force() {
  for (uint64_t t = 0; t <= 60; ++t)
    for (uint64_t d = 0; d <= t * t / 4 + 2; ++d) {
      Day06::Race r{t, d};
      assert(Day06::countWays(r) == Day06::countWaysBruteForce(r));
    }
}

static void test_unbeatable_record() {
  assert(Day06::countWays({4, 4}) == 0);   // best is 2 * 2 = 4
  assert(Day06::countWays({4, 100}) == 0);
}

int main() {
  test_example();
  test_closed_form_matches_brute_force();
  test_unbeatable_record();

  std::cout << "[OK] Day 06 tests passed\n";
  return 0;
}
