#include <cassert>
#include <iostream>
#include <stdexcept>

#include "../include/Day10.hpp"

using Day10::Maze;

static const char* kSquare =
    ".....\n"
    ".S-7.\n"
    ".|.|.\n"
    ".L-J.\n"
    ".....\n";

// Same loop with unconnected pipes around it
static const char* kNoisySquare =
    "-L|F7\n"
    "7S-7|\n"
    "L|7||\n"
    "-L-J|\n"
    "L|-JF\n";

static const char* kComplex =
    "..F7.\n"
    ".FJ|.\n"
    "SJ.L7\n"
    "|F--J\n"
    "LJ...\n";

static const char* kOpenPockets =
    "...........\n"
    ".S-------7.\n"
    ".|F-----7|.\n"
    ".||.....||.\n"
    ".||.....||.\n"
    ".|L-7.F-J|.\n"
    ".|..|.|..|.\n"
    ".L--J.L--J.\n"
    "...........\n";

// No gap between the two pockets; the outside still squeezes between pipes
static const char* kSqueeze =
    "..........\n"
    ".S------7.\n"
    ".|F----7|.\n"
    ".||....||.\n"
    ".||....||.\n"
    ".|L-7F-J|.\n"
    ".|..||..|.\n"
    ".L--JL--J.\n"
    "..........\n";

static const char* kLarger =
    ".F----7F7F7F7F-7....\n"
    ".|F--7||||||||FJ....\n"
    ".||.FJ||||||||L7....\n"
    "FJL7L7LJLJ||LJ.L-7..\n"
    "L--J.L7...LJS7F-7L7.\n"
    "....F-J..F7FJ|L7L7L7\n"
    "....L7.F7||L7|.L7L7|\n"
    ".....|FJLJ|FJ|F7|.LJ\n"
    "....FJL-7.||.||||...\n"
    "....L---J.LJ.LJLJ...\n";

static const char* kJunk =
    "FF7FSF7F7F7F7F7F---7\n"
    "L|LJ||||||||||||F--J\n"
    "FL-7LJLJ||||||LJL-77\n"
    "F--JF--7||LJLJ7F7FJ-\n"
    "L---JF-JLJ.||-FJLJJ7\n"
    "|F|F-JF---7F7-L7L|7|\n"
    "|FFJF7L7F-JF7|JL---7\n"
    "7-L-JL7||F7|L7F-7F7|\n"
    "L.L7LFJ|||||FJL7||LJ\n"
    "L7JLJL-JLJLJL--JLJ.L\n";

static void test_openings() {
  assert(Day10::opensTo('|', Day10::Direction::North));
  assert(!Day10::opensTo('-', Day10::Direction::North));
  assert(Day10::opensTo('F', Day10::Direction::East));
  assert(!Day10::opensTo('S', Day10::Direction::South));
  assert(!Day10::opensTo('.', Day10::Direction::West));
  assert(Day10::opposite(Day10::Direction::East) == Day10::Direction::West);
}

static void test_farthest() {
  Maze square = Maze::parse(kSquare);
  assert(square.loopLength() == 8);
  assert(square.farthestDistance() == 4);
  assert(square.startPipe() == 'F');
  assert(square.onLoop(1, 1) && square.onLoop(3, 3));
  assert(!square.onLoop(2, 2));

  Maze noisy = Maze::parse(kNoisySquare);
  assert(noisy.farthestDistance() == 4);
  assert(!noisy.onLoop(0, 0));

  assert(Maze::parse(kComplex).farthestDistance() == 8);
}

static void test_enclosed() {
  assert(Maze::parse(kSquare).enclosedTiles() == 1);
  assert(Maze::parse(kOpenPockets).enclosedTiles() == 4);
  assert(Maze::parse(kSqueeze).enclosedTiles() == 4);
  assert(Maze::parse(kLarger).enclosedTiles() == 8);

  // S hides a 7 here, which has no north opening
  Maze junk = Maze::parse(kJunk);
  assert(junk.startPipe() == '7');
  assert(junk.enclosedTiles() == 10);
}

static void test_solver() {
  Day10::Solver s;
  auto answers = s.solve(kLarger);
  assert(answers.size() == 2);
  assert(answers[0].value == 70);
  assert(answers[1].value == 8);
}

static void test_bad_mazes() {
  auto throws = [](const char* text) {
    try {
      Maze::parse(text);
    } catch (const std::runtime_error&) {
      return true;
    }
    return false;
  };
  assert(throws("...\n.|.\n...\n"));   // no S
  assert(throws("S.\n..\n"));          // S on no loop
  assert(throws("S-7\n|x|\nL-J\n"));   // unknown tile
}

int main() {
  test_openings();
  test_farthest();
  test_enclosed();
  test_solver();
  test_bad_mazes();

  std::cout << "[OK] Day 10 tests passed\n";
  return 0;
}
