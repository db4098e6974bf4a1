#ifndef DAY02_HPP
#define DAY02_HPP

#include <cstdint>
#include <string_view>
#include <vector>

#include "Puzzle.hpp"

// Cube Conundrum
namespace Day02 {
enum class Color { Red, Green, Blue };

struct Cube {
  Color color{Color::Red};
  uint32_t quantity{};
};

// Game id and the most cubes of each color shown in any draw
class Game {
 private:
  uint32_t id_{};
  uint32_t maxRed_{}, maxGreen_{}, maxBlue_{};

 public:
  static constexpr uint32_t kLimitRed = 12;
  static constexpr uint32_t kLimitGreen = 13;
  static constexpr uint32_t kLimitBlue = 14;

  explicit Game(uint32_t id);

  uint32_t id() const;
  void update(const Cube& cube);

  // Every maximum within its color limit
  bool isValid() const;
  uint32_t power() const;
};

Color parseColor(std::string_view s);
// "3 blue"
Cube parseCube(std::string_view s);
// "Game 1: 3 blue, 4 red; 1 red, 2 green"
std::vector<Game> parseInput(std::string_view input);

int64_t sumValid(const std::vector<Game>& games);
int64_t sumPowers(const std::vector<Game>& games);

class Solver : public Puzzle::Solver {
 public:
  int day() const override { return 2; }
  std::vector<Model::Answer> solve(const std::string& input) override;
};
};  // namespace Day02

#endif
