#include "../include/Day02.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "../include/IO.hpp"

namespace Day02 {

Game::Game(uint32_t id) : id_(id) {}

uint32_t Game::id() const { return id_; }

void Game::update(const Cube& cube) {
  switch (cube.color) {
    case Color::Red:
      maxRed_ = std::max(maxRed_, cube.quantity);
      break;
    case Color::Green:
      maxGreen_ = std::max(maxGreen_, cube.quantity);
      break;
    case Color::Blue:
      maxBlue_ = std::max(maxBlue_, cube.quantity);
      break;
  }
}

bool Game::isValid() const {
  return maxRed_ <= kLimitRed && maxGreen_ <= kLimitGreen &&
         maxBlue_ <= kLimitBlue;
}

uint32_t Game::power() const { return maxRed_ * maxGreen_ * maxBlue_; }

Color parseColor(std::string_view s) {
  if (s == "red") return Color::Red;
  if (s == "green") return Color::Green;
  if (s == "blue") return Color::Blue;
  throw std::runtime_error("Unknown cube color: " + std::string(s));
}

Cube parseCube(std::string_view s) {
  std::vector<std::string_view> parts = IO::words(s);
  if (parts.size() != 2)
    throw std::runtime_error("Invalid cube record: " + std::string(s));
  return Cube{parseColor(parts[1]), IO::parseInt<uint32_t>(parts[0])};
}

std::vector<Game> parseInput(std::string_view input) {
  std::vector<Game> games;
  for (std::string_view line : IO::lines(input)) {
    if (IO::trim(line).empty()) continue;

    auto [head, record] = IO::splitOnce(line, ": ");
    Game game(IO::parseInt<uint32_t>(IO::stripPrefix(head, "Game ")));

    // draws (';') and cubes (',') update the maxima the same way
    for (std::string_view cube : IO::split(record, ",;"))
      game.update(parseCube(cube));

    games.push_back(game);
  }
  return games;
}

int64_t sumValid(const std::vector<Game>& games) {
  int64_t sum = 0;
  for (const auto& g : games)
    if (g.isValid()) sum += g.id();
  return sum;
}

int64_t sumPowers(const std::vector<Game>& games) {
  int64_t sum = 0;
  for (const auto& g : games) sum += g.power();
  return sum;
}

std::vector<Model::Answer> Solver::solve(const std::string& input) {
  std::vector<Game> games = parseInput(input);
  return {
      {1, "Sum of valid game IDs", sumValid(games)},
      {2, "Sum of powers", sumPowers(games)},
  };
}

};  // namespace Day02
