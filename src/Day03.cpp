#include "../include/Day03.hpp"

#include <cctype>
#include <cstdlib>
#include <numeric>
#include <string>

#include "../include/IO.hpp"

namespace {
inline bool isDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

inline bool isSymbol(char c) { return c != '.' && !isDigit(c); }
}  // namespace

namespace Day03 {

bool Number::isAdjacent(int px, int py) const {
  return std::abs(py - y) <= 1 && px >= x0 - 1 && px <= x1 + 1;
}

Model::Grid parseSchematic(std::string_view input) {
  std::vector<std::string> rows;
  for (std::string_view line : IO::lines(input))
    if (!IO::trim(line).empty()) rows.emplace_back(line);
  return Model::Grid::fromLines(rows).padded('.');
}

std::vector<Number> findPartNumbers(const Model::Grid& padded) {
  std::vector<Number> parts;

  for (int y = 1; y + 1 < padded.height(); ++y) {
    int x = 1;
    while (x + 1 < padded.width()) {
      if (!isDigit(padded.at(x, y))) {
        ++x;
        continue;
      }

      Number n{0, y, x, x};
      while (isDigit(padded.at(x, y))) {
        n.value = n.value * 10 + static_cast<uint32_t>(padded.at(x, y) - '0');
        n.x1 = x++;
      }

      // Border cells are '.', so x0 - 1 and x1 + 1 are always in range
      bool isPart = false;
      for (int yy = y - 1; yy <= y + 1 && !isPart; ++yy)
        for (int xx = n.x0 - 1; xx <= n.x1 + 1 && !isPart; ++xx)
          isPart = isSymbol(padded.at(xx, yy));

      if (isPart) parts.push_back(n);
    }
  }
  return parts;
}

std::vector<int64_t> findGearRatios(const Model::Grid& padded,
                                    const std::vector<Number>& parts) {
  std::vector<int64_t> ratios;

  // TODO: index parts by row; this is O(stars * parts)
  for (int y = 0; y < padded.height(); ++y) {
    for (int x = 0; x < padded.width(); ++x) {
      if (padded.at(x, y) != '*') continue;

      std::vector<uint32_t> adjacent;
      for (const auto& n : parts)
        if (n.isAdjacent(x, y)) adjacent.push_back(n.value);

      if (adjacent.size() == 2)
        ratios.push_back(static_cast<int64_t>(adjacent[0]) * adjacent[1]);
    }
  }
  return ratios;
}

int64_t sumNumbers(const std::vector<Number>& parts) {
  int64_t sum = 0;
  for (const auto& n : parts) sum += n.value;
  return sum;
}

std::vector<Model::Answer> Solver::solve(const std::string& input) {
  Model::Grid grid = parseSchematic(input);
  std::vector<Number> parts = findPartNumbers(grid);
  std::vector<int64_t> ratios = findGearRatios(grid, parts);

  return {
      {1, "Sum of part numbers", sumNumbers(parts)},
      {2, "Gear ratio sum",
       std::accumulate(ratios.begin(), ratios.end(), int64_t{0})},
  };
}

};  // namespace Day03
