#ifndef MODEL_HPP
#define MODEL_HPP

#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Model {
// One printed result of a puzzle part
struct Answer {
  int part{1};
  std::string label;
  int64_t value{};
};

// Row-major character grid, (x, y) = (column, row)
class Grid {
 private:
  int W{}, H{};
  std::vector<char> cells;
  inline size_t idx(int x, int y) const;

 public:
  Grid() = default;
  Grid(int w, int h, char fill = '.');

  // Build from text lines; every line must have the same width
  static Grid fromLines(const std::vector<std::string>& lines);

  // Dimension
  int width() const;
  int height() const;

  bool contains(int x, int y) const;

  // element access
  char& at(int x, int y);
  const char& at(int x, int y) const;

  // Copy surrounded by a one cell border of 'border'
  Grid padded(char border) const;

  // Index of the first cell holding c, or -1
  long find(char c) const;

  size_t size() const;
};

};  // namespace Model

#endif
