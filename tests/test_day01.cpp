#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "../include/Day01.hpp"

using Day01::digitsPlain;
using Day01::digitsSpelled;
using Day01::totalCalibration;

static void test_plain_digits() {
  assert(totalCalibration("1abc2", digitsPlain) == 12);
  assert(totalCalibration("pqr3stu8vwx", digitsPlain) == 38);
  assert(totalCalibration("a1b2c3d4e5f", digitsPlain) == 15);
  // a single digit is both first and last
  assert(totalCalibration("treb7uchet", digitsPlain) == 77);

  assert(totalCalibration("1abc2\npqr3stu8vwx\na1b2c3d4e5f\ntreb7uchet\n",
                          digitsPlain) == 142);
}

static void test_spelled_digits() {
  assert(totalCalibration("two1nine", digitsSpelled) == 29);
  assert(totalCalibration("eightwothree", digitsSpelled) == 83);
  assert(totalCalibration("abcone2threexyz", digitsSpelled) == 13);
  assert(totalCalibration("xtwone3four", digitsSpelled) == 24);
  assert(totalCalibration("4nineeightseven2", digitsSpelled) == 42);
  assert(totalCalibration("zoneight234", digitsSpelled) == 14);
  assert(totalCalibration("7pqrstsixteen", digitsSpelled) == 76);
  // overlapping words both count
  assert(totalCalibration("oneight", digitsSpelled) == 18);

  const std::string example =
      "two1nine\n"
      "eightwothree\n"
      "abcone2threexyz\n"
      "xtwone3four\n"
      "4nineeightseven2\n"
      "zoneight234\n"
      "7pqrstsixteen\n";
  assert(totalCalibration(example, digitsSpelled) == 281);
}

static void test_line_without_digit() {
  bool threw = false;
  try {
    totalCalibration("abc", digitsPlain);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

static void test_solver_answers() {
  Day01::Solver s;
  auto answers = s.solve("1abc2\ntreb7uchet\n");
  assert(answers.size() == 2);
  assert(answers[0].part == 1 && answers[0].value == 12 + 77);
  assert(answers[1].part == 2 && answers[1].value == 12 + 77);
}

int main() {
  test_plain_digits();
  test_spelled_digits();
  test_line_without_digit();
  test_solver_answers();

  std::cout << "[OK] Day 01 tests passed\n";
  return 0;
}
