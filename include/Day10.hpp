#ifndef DAY10_HPP
#define DAY10_HPP

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "Model.hpp"
#include "Puzzle.hpp"

// Pipe Maze
namespace Day10 {
enum class Direction { North, South, East, West };

Direction opposite(Direction d);

// True if the tile has an opening towards d ('S' and ground have none)
bool opensTo(char tile, Direction d);

class Maze {
 private:
  Model::Grid grid_;
  int startX_{}, startY_{};
  char startPipe_{'.'};
  std::vector<bool> loop_;  // tiles of the main loop
  size_t loopLength_{};

  // Follow the pipes from S leaving towards first; the loop must come back
  // into S from second. Returns the loop length.
  std::optional<size_t> trace(Direction first, Direction second,
                              std::vector<bool>& marks) const;

 public:
  // Finds S, works out which pipe it hides and traces the loop
  explicit Maze(Model::Grid grid);

  static Maze parse(std::string_view input);

  char startPipe() const;
  size_t loopLength() const;
  bool onLoop(int x, int y) const;

  // Steps to the loop tile farthest from S
  int64_t farthestDistance() const;

  // Tiles strictly inside the loop. Scanning a row left to right, every loop
  // tile opening north flips inside/outside.
  int64_t enclosedTiles() const;
};

class Solver : public Puzzle::Solver {
 public:
  int day() const override { return 10; }
  std::vector<Model::Answer> solve(const std::string& input) override;
};
};  // namespace Day10

#endif
