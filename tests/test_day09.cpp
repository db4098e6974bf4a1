#include <cassert>
#include <iostream>

#include "../include/Day09.hpp"

static const char* kExample =
    "0 3 6 9 12 15\n"
    "1 3 6 10 15 21\n"
    "10 13 16 21 30 45\n";

static void test_differences() {
  Day09::History d = Day09::differences({10, 13, 16, 21, 30, 45});
  assert((d == Day09::History{3, 3, 5, 9, 15}));
  assert(Day09::differences({5}).empty());
}

static void test_single_lines() {
  auto h = Day09::parseInput(kExample);
  assert(h.size() == 3);

  assert(Day09::extrapolateForward(h[0]) == 18);
  assert(Day09::extrapolateForward(h[1]) == 28);
  assert(Day09::extrapolateForward(h[2]) == 68);

  assert(Day09::extrapolateBackward(h[0]) == -3);
  assert(Day09::extrapolateBackward(h[1]) == 0);
  assert(Day09::extrapolateBackward(h[2]) == 5);
}

static void test_example() {
  auto h = Day09::parseInput(kExample);
  assert(Day09::sumExtrapolated(h, Day09::extrapolateForward) == 114);
  assert(Day09::sumExtrapolated(h, Day09::extrapolateBackward) == 2);
}

static void test_negative_values() {
  auto h = Day09::parseInput("-4 -8 -12\n");
  assert(Day09::extrapolateForward(h[0]) == -16);
  assert(Day09::extrapolateBackward(h[0]) == 0);
}

int main() {
  test_differences();
  test_single_lines();
  test_example();
  test_negative_values();

  std::cout << "[OK] Day 09 tests passed\n";
  return 0;
}
