#include "../include/Model.hpp"

#include <algorithm>
#include <cstddef>

using namespace Model;

Grid::Grid(int w, int h, char fill)
    : W(w), H(h), cells(static_cast<size_t>(std::max(w, 0)) * std::max(h, 0), fill) {
  if (w < 0 || h < 0) throw std::invalid_argument("Negative grid dimensions");
};

Grid Grid::fromLines(const std::vector<std::string>& lines) {
  if (lines.empty()) throw std::runtime_error("Empty grid");

  const int w = static_cast<int>(lines.front().size());
  Grid g(w, static_cast<int>(lines.size()));
  for (int y = 0; y < g.H; ++y) {
    const std::string& row = lines[static_cast<size_t>(y)];
    if (static_cast<int>(row.size()) != w)
      throw std::runtime_error("Ragged grid row " + std::to_string(y));
    std::copy(row.begin(), row.end(),
              g.cells.begin() + static_cast<std::ptrdiff_t>(y) * w);
  }
  return g;
}

int Grid::width() const { return W; };

int Grid::height() const { return H; };

bool Grid::contains(int x, int y) const {
  return x >= 0 && x < W && y >= 0 && y < H;
}

inline size_t Grid::idx(int x, int y) const {
  assert(x >= 0 && x < W);
  assert(y >= 0 && y < H);
  return static_cast<size_t>(x) + static_cast<size_t>(y) * W;
}

char& Grid::at(int x, int y) { return cells[idx(x, y)]; };

const char& Grid::at(int x, int y) const { return cells[idx(x, y)]; };

Grid Grid::padded(char border) const {
  Grid out(W + 2, H + 2, border);
  for (int y = 0; y < H; ++y)
    for (int x = 0; x < W; ++x) out.at(x + 1, y + 1) = at(x, y);
  return out;
}

long Grid::find(char c) const {
  auto it = std::find(cells.begin(), cells.end(), c);
  return it == cells.end() ? -1L : static_cast<long>(it - cells.begin());
}

size_t Grid::size() const { return cells.size(); };
