#ifndef DAY08_HPP
#define DAY08_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Puzzle.hpp"

// Haunted Wasteland
//
// Part 2 assumes every ghost path loops back onto its first Z node with the
// same period, so the answer is the LCM of the individual path lengths.
namespace Day08 {
using Nodes = std::unordered_map<std::string, std::pair<std::string, std::string>>;

struct Network {
  std::string directions;  // 'L' / 'R'
  Nodes nodes;
  std::vector<std::string> starts;  // nodes ending in 'A', input order
};

// "LLR", blank line, then "AAA = (BBB, CCC)" lines
Network parseInput(std::string_view input);

// Steps from start until isEnd holds, cycling through the directions
uint64_t walk(const Network& net, const std::string& start,
              const std::function<bool(const std::string&)>& isEnd);

// AAA to ZZZ
uint64_t solvePart1(const Network& net);

// Every ..A node to a ..Z node at once
uint64_t solvePart2(const Network& net);

uint64_t lcmOf(const std::vector<uint64_t>& values);

class Solver : public Puzzle::Solver {
 public:
  int day() const override { return 8; }
  std::vector<Model::Answer> solve(const std::string& input) override;
};
};  // namespace Day08

#endif
