#ifndef DAY03_HPP
#define DAY03_HPP

#include <cstdint>
#include <string_view>
#include <vector>

#include "Model.hpp"
#include "Puzzle.hpp"

// Gear Ratios
//
// A symbol is anything that is neither a digit nor '.'. A part number is a run
// of digits with a symbol in its 8-neighbourhood. A gear is a '*' touching
// exactly two part numbers; its ratio is their product.
//
// The schematic is padded with '.' so neighbourhood scans never leave the grid.
namespace Day03 {
// A run of digits on row y spanning columns [x0, x1]
struct Number {
  uint32_t value{};
  int y{}, x0{}, x1{};

  bool isAdjacent(int x, int y) const;
};

Model::Grid parseSchematic(std::string_view input);

// Numbers of the padded grid with a symbol around them
std::vector<Number> findPartNumbers(const Model::Grid& padded);

// Ratios of every gear
std::vector<int64_t> findGearRatios(const Model::Grid& padded,
                                    const std::vector<Number>& parts);

int64_t sumNumbers(const std::vector<Number>& parts);

class Solver : public Puzzle::Solver {
 public:
  int day() const override { return 3; }
  std::vector<Model::Answer> solve(const std::string& input) override;
};
};  // namespace Day03

#endif
