#include "../include/Day10.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

#include "../include/IO.hpp"

namespace {
using Day10::Direction;

constexpr std::array<Direction, 4> kDirections = {
    Direction::North, Direction::South, Direction::East, Direction::West};

// Pipes keyed by their two openings
struct PipeShape {
  char tile;
  Direction a, b;
};

constexpr std::array<PipeShape, 6> kPipes = {{
    {'|', Direction::North, Direction::South},
    {'-', Direction::East, Direction::West},
    {'L', Direction::North, Direction::East},
    {'J', Direction::North, Direction::West},
    {'7', Direction::South, Direction::West},
    {'F', Direction::South, Direction::East},
}};

inline void step(Direction d, int& x, int& y) {
  switch (d) {
    case Direction::North: --y; break;
    case Direction::South: ++y; break;
    case Direction::East: ++x; break;
    case Direction::West: --x; break;
  }
}

bool isPipe(char tile) {
  for (const auto& p : kPipes)
    if (p.tile == tile) return true;
  return false;
}

char pipeFor(Direction a, Direction b) {
  for (const auto& p : kPipes)
    if ((p.a == a && p.b == b) || (p.a == b && p.b == a)) return p.tile;
  throw std::logic_error("No pipe joins these directions");
}

// The opening of tile that is not `from`
Direction exitOf(char tile, Direction from) {
  for (const auto& p : kPipes) {
    if (p.tile != tile) continue;
    return p.a == from ? p.b : p.a;
  }
  throw std::logic_error(std::string("Not a pipe: ") + tile);
}
}  // namespace

namespace Day10 {

Direction opposite(Direction d) {
  switch (d) {
    case Direction::North: return Direction::South;
    case Direction::South: return Direction::North;
    case Direction::East: return Direction::West;
    case Direction::West: return Direction::East;
  }
  throw std::logic_error("Invalid direction");
}

bool opensTo(char tile, Direction d) {
  for (const auto& p : kPipes)
    if (p.tile == tile) return p.a == d || p.b == d;
  return false;
}

Maze::Maze(Model::Grid grid) : grid_(std::move(grid)) {
  for (int y = 0; y < grid_.height(); ++y)
    for (int x = 0; x < grid_.width(); ++x) {
      const char c = grid_.at(x, y);
      if (c != 'S' && c != '.' && !isPipe(c))
        throw std::runtime_error(std::string("Invalid tile: ") + c);
    }

  const long idx = grid_.find('S');
  if (idx < 0) throw std::runtime_error("No starting tile");
  startX_ = static_cast<int>(idx % grid_.width());
  startY_ = static_cast<int>(idx / grid_.width());

  // Neighbours with a pipe pointing back at S
  std::vector<Direction> candidates;
  for (Direction d : kDirections) {
    int x = startX_, y = startY_;
    step(d, x, y);
    if (grid_.contains(x, y) && opensTo(grid_.at(x, y), opposite(d)))
      candidates.push_back(d);
  }

  // More than two candidates can happen; keep the first pair that closes
  for (size_t i = 0; i < candidates.size(); ++i) {
    for (size_t j = i + 1; j < candidates.size(); ++j) {
      std::vector<bool> marks(grid_.size(), false);
      std::optional<size_t> len = trace(candidates[i], candidates[j], marks);
      if (!len) continue;

      startPipe_ = pipeFor(candidates[i], candidates[j]);
      loop_ = std::move(marks);
      loopLength_ = *len;
      return;
    }
  }
  throw std::runtime_error("Starting tile is not on a loop");
}

std::optional<size_t> Maze::trace(Direction first, Direction second,
                                  std::vector<bool>& marks) const {
  int x = startX_, y = startY_;
  Direction dir = first;
  size_t len = 0;

  marks[static_cast<size_t>(y) * grid_.width() + x] = true;
  while (len <= grid_.size()) {
    step(dir, x, y);
    ++len;
    if (!grid_.contains(x, y)) return std::nullopt;

    if (x == startX_ && y == startY_) {
      if (opposite(dir) != second) return std::nullopt;
      return len;
    }

    const char tile = grid_.at(x, y);
    const Direction from = opposite(dir);
    if (!opensTo(tile, from)) return std::nullopt;

    marks[static_cast<size_t>(y) * grid_.width() + x] = true;
    dir = exitOf(tile, from);
  }
  return std::nullopt;
}

Maze Maze::parse(std::string_view input) {
  std::vector<std::string> rows;
  for (std::string_view line : IO::lines(input))
    if (!IO::trim(line).empty()) rows.emplace_back(IO::trim(line));
  return Maze(Model::Grid::fromLines(rows));
}

char Maze::startPipe() const { return startPipe_; }

size_t Maze::loopLength() const { return loopLength_; }

bool Maze::onLoop(int x, int y) const {
  return grid_.contains(x, y) &&
         loop_[static_cast<size_t>(y) * grid_.width() + x];
}

int64_t Maze::farthestDistance() const {
  return static_cast<int64_t>(loopLength_ / 2);
}

int64_t Maze::enclosedTiles() const {
  int64_t count = 0;
  for (int y = 0; y < grid_.height(); ++y) {
    bool inside = false;
    for (int x = 0; x < grid_.width(); ++x) {
      if (onLoop(x, y)) {
        const char tile =
            (x == startX_ && y == startY_) ? startPipe_ : grid_.at(x, y);
        if (opensTo(tile, Direction::North)) inside = !inside;
      } else if (inside) {
        ++count;
      }
    }
  }
  return count;
}

std::vector<Model::Answer> Solver::solve(const std::string& input) {
  Maze maze = Maze::parse(input);
  return {
      {1, "Farthest distance", maze.farthestDistance()},
      {2, "Enclosed tiles", maze.enclosedTiles()},
  };
}

};  // namespace Day10
