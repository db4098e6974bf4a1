#include "../include/Day08.hpp"

#include <numeric>
#include <stdexcept>

#include "../include/IO.hpp"

namespace Day08 {

Network parseInput(std::string_view input) {
  std::vector<std::string_view> rows = IO::lines(input);
  if (rows.empty()) throw std::runtime_error("Empty network");

  Network net;
  net.directions = std::string(IO::trim(rows[0]));
  if (net.directions.empty() ||
      net.directions.find_first_not_of("LR") != std::string::npos)
    throw std::runtime_error("Invalid directions: " + net.directions);

  for (size_t i = 1; i < rows.size(); ++i) {
    std::string_view line = IO::trim(rows[i]);
    if (line.empty()) continue;

    auto [node, targets] = IO::splitOnce(line, " = ");
    targets = IO::trim(targets);
    if (targets.size() < 2 || targets.front() != '(' || targets.back() != ')')
      throw std::runtime_error("Invalid node: " + std::string(line));
    targets = targets.substr(1, targets.size() - 2);
    auto [left, right] = IO::splitOnce(targets, ",");

    std::string name(IO::trim(node));
    if (name.empty()) throw std::runtime_error("Unnamed node: " + std::string(line));
    net.nodes[name] = {std::string(IO::trim(left)), std::string(IO::trim(right))};
    if (name.back() == 'A') net.starts.push_back(name);
  }
  return net;
}

uint64_t walk(const Network& net, const std::string& start,
              const std::function<bool(const std::string&)>& isEnd) {
  const std::string* node = &start;
  uint64_t count = 0;

  for (;;) {
    for (char dir : net.directions) {
      auto it = net.nodes.find(*node);
      if (it == net.nodes.end())
        throw std::runtime_error("Unknown node: " + *node);

      node = dir == 'L' ? &it->second.first : &it->second.second;
      ++count;
      if (isEnd(*node)) return count;
    }
  }
}

uint64_t solvePart1(const Network& net) {
  return walk(net, "AAA", [](const std::string& n) { return n == "ZZZ"; });
}

uint64_t solvePart2(const Network& net) {
  std::vector<uint64_t> lengths;
  for (const auto& s : net.starts)
    lengths.push_back(
        walk(net, s, [](const std::string& n) { return n.back() == 'Z'; }));
  return lcmOf(lengths);
}

uint64_t lcmOf(const std::vector<uint64_t>& values) {
  if (values.empty()) throw std::runtime_error("No starting nodes");
  uint64_t result = values[0];
  for (size_t i = 1; i < values.size(); ++i)
    result = std::lcm(result, values[i]);
  return result;
}

std::vector<Model::Answer> Solver::solve(const std::string& input) {
  Network net = parseInput(input);
  return {
      {1, "Total steps", static_cast<int64_t>(solvePart1(net))},
      {2, "Total steps", static_cast<int64_t>(solvePart2(net))},
  };
}

};  // namespace Day08
