#ifndef DAY05_HPP
#define DAY05_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "Puzzle.hpp"
#include "Worker.hpp"

// If You Give A Seed A Fertilizer
//
// An almanac is a chain of maps (seed-to-soil, soil-to-fertilizer, ...). Each
// map is a set of disjoint source intervals, each translated to a destination
// start; values outside every interval map to themselves.
namespace Day05 {
// Source interval [start, stop) translated to destination
struct Entry {
  uint64_t destination{};
  uint64_t start{};
  uint64_t stop{};

  bool contains(uint64_t v) const { return v >= start && v < stop; }
};

class RangeMap {
 private:
  std::vector<Entry> entries_;  // sorted by start

 public:
  RangeMap() = default;
  explicit RangeMap(std::vector<Entry> entries);

  // Binary search for the interval holding v
  uint64_t map(uint64_t v) const;

  // Image of whole ranges, split at interval boundaries. Output is unsorted
  // and may contain adjacent pieces.
  std::vector<Worker::SeedRange> mapRanges(
      const std::vector<Worker::SeedRange>& ranges) const;

  const std::vector<Entry>& entries() const;
};

using Almanac = std::vector<RangeMap>;

struct Input {
  std::vector<uint64_t> seeds;
  Almanac almanac;
};

// "50 98 2" = destination, source start, length
Entry parseEntry(std::string_view line);
Input parseInput(std::string_view input);

// Push one seed through every map
uint64_t locate(const Almanac& almanac, uint64_t seed);

// Part 1: listed seeds only
uint64_t lowestLocation(const std::vector<uint64_t>& seeds,
                        const Almanac& almanac);

// Part 2 reading of the seed list as (start, length) pairs
std::vector<Worker::SeedRange> seedRanges(const std::vector<uint64_t>& seeds);

// Part 2 by mapping every seed; the worker decides how the work is spread
uint64_t lowestLocationBruteForce(const std::vector<Worker::SeedRange>& ranges,
                                  const Almanac& almanac,
                                  Worker::WorkerBackend& worker);

// Part 2 by pushing whole intervals through the maps
uint64_t lowestLocationRanges(const std::vector<Worker::SeedRange>& ranges,
                              const Almanac& almanac);

class Solver : public Puzzle::Solver {
 private:
  std::unique_ptr<Worker::WorkerBackend> worker_;
  std::string method_;

 public:
  // method: "default" / "bruteforce" or "ranges"
  Solver(std::unique_ptr<Worker::WorkerBackend> worker,
         const std::string& method = "default");

  int day() const override { return 5; }
  std::vector<Model::Answer> solve(const std::string& input) override;
};
};  // namespace Day05

#endif
