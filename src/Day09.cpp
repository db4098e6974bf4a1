#include "../include/Day09.hpp"

#include <algorithm>
#include <stdexcept>

#include "../include/IO.hpp"

namespace {
bool allZero(const Day09::History& data) {
  return std::all_of(data.begin(), data.end(),
                     [](int64_t n) { return n == 0; });
}
}  // namespace

namespace Day09 {

std::vector<History> parseInput(std::string_view input) {
  std::vector<History> out;
  for (std::string_view line : IO::lines(input))
    if (!IO::trim(line).empty()) out.push_back(IO::parseNumbers<int64_t>(line));
  return out;
}

History differences(const History& data) {
  History step;
  for (size_t i = 1; i < data.size(); ++i) step.push_back(data[i] - data[i - 1]);
  return step;
}

int64_t extrapolateForward(const History& data) {
  if (data.empty()) throw std::runtime_error("Empty history");
  const History step = differences(data);
  return data.back() + (allZero(step) ? 0 : extrapolateForward(step));
}

int64_t extrapolateBackward(const History& data) {
  if (data.empty()) throw std::runtime_error("Empty history");
  const History step = differences(data);
  return data.front() - (allZero(step) ? 0 : extrapolateBackward(step));
}

int64_t sumExtrapolated(const std::vector<History>& histories,
                        int64_t (*fn)(const History&)) {
  int64_t sum = 0;
  for (const auto& h : histories) sum += fn(h);
  return sum;
}

std::vector<Model::Answer> Solver::solve(const std::string& input) {
  std::vector<History> histories = parseInput(input);
  return {
      {1, "Sum of extrapolated next values",
       sumExtrapolated(histories, extrapolateForward)},
      {2, "Sum of extrapolated previous values",
       sumExtrapolated(histories, extrapolateBackward)},
  };
}

};  // namespace Day09
