#include "../include/Day06.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "../include/IO.hpp"

namespace {
std::vector<std::string_view> raceLines(std::string_view input) {
  std::vector<std::string_view> rows;
  for (std::string_view line : IO::lines(input))
    if (!IO::trim(line).empty()) rows.push_back(line);
  if (rows.size() != 2)
    throw std::runtime_error("Expected a Time and a Distance line");
  return rows;
}
}  // namespace

namespace Day06 {

std::vector<Race> parseInput(std::string_view input) {
  std::vector<std::string_view> rows = raceLines(input);
  std::vector<uint64_t> times =
      IO::parseNumbers<uint64_t>(IO::stripPrefix(rows[0], "Time:"));
  std::vector<uint64_t> distances =
      IO::parseNumbers<uint64_t>(IO::stripPrefix(rows[1], "Distance:"));

  if (times.size() != distances.size())
    throw std::runtime_error("Time and Distance counts differ");

  std::vector<Race> races;
  for (size_t i = 0; i < times.size(); ++i)
    races.push_back({times[i], distances[i]});
  return races;
}

Race parseJoined(std::string_view input) {
  std::string joined(input);
  joined.erase(std::remove(joined.begin(), joined.end(), ' '), joined.end());

  std::vector<Race> races = parseInput(joined);
  if (races.size() != 1) throw std::runtime_error("Expected a single race");
  return races.front();
}

int64_t countWays(const Race& race) {
  const long double t = static_cast<long double>(race.time);
  const long double delta = t * t - 4.0L * static_cast<long double>(race.distance);
  if (delta <= 0) return 0;  // the record can at best be matched

  const long double root = std::sqrt(delta);
  const int64_t low = static_cast<int64_t>(std::floor((t - root) / 2 + 1));
  const int64_t high = static_cast<int64_t>(std::ceil((t + root) / 2 - 1));

  return std::max<int64_t>(0, high - low + 1);
}

int64_t countWaysBruteForce(const Race& race) {
  int64_t ways = 0;
  for (uint64_t hold = 0; hold <= race.time; ++hold)
    if (hold * (race.time - hold) > race.distance) ++ways;
  return ways;
}

int64_t productOfWays(const std::vector<Race>& races) {
  int64_t product = 1;
  for (const auto& r : races) product *= countWays(r);
  return product;
}

std::vector<Model::Answer> Solver::solve(const std::string& input) {
  return {
      {1, "Product of the number of ways to beat the record",
       productOfWays(parseInput(input))},
      {2, "Number of ways to beat the record", countWays(parseJoined(input))},
  };
}

};  // namespace Day06
