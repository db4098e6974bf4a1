#ifndef PUZZLE_HPP
#define PUZZLE_HPP

#include <string>
#include <vector>

#include "Model.hpp"

namespace Puzzle {
// Common interface for every day's solution
class Solver {
 public:
  virtual ~Solver() = default;

  virtual int day() const = 0;

  // Parse the whole input text and compute both parts. Throws on malformed
  // input.
  virtual std::vector<Model::Answer> solve(const std::string& input) = 0;
};
};  // namespace Puzzle

#endif
