#include "../include/Day05.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include "../include/IO.hpp"

using Worker::SeedRange;

namespace Day05 {

RangeMap::RangeMap(std::vector<Entry> entries) : entries_(std::move(entries)) {
  std::sort(entries_.begin(), entries_.end(),
            [](const Entry& a, const Entry& b) { return a.start < b.start; });
}

uint64_t RangeMap::map(uint64_t v) const {
  // first entry starting after v; the candidate is the one before it
  auto it = std::upper_bound(
      entries_.begin(), entries_.end(), v,
      [](uint64_t value, const Entry& e) { return value < e.start; });
  if (it == entries_.begin()) return v;
  --it;
  return it->contains(v) ? it->destination + (v - it->start) : v;
}

std::vector<SeedRange> RangeMap::mapRanges(
    const std::vector<SeedRange>& ranges) const {
  std::vector<SeedRange> out;

  for (const auto& r : ranges) {
    if (r.length == 0) continue;
    uint64_t cursor = r.start;
    const uint64_t end = r.start + r.length;

    // skip entries that end before the range
    auto it = std::lower_bound(
        entries_.begin(), entries_.end(), cursor,
        [](const Entry& e, uint64_t value) { return e.stop <= value; });

    for (; it != entries_.end() && it->start < end && cursor < end; ++it) {
      if (it->start > cursor) {
        // gap before the entry maps to itself
        out.push_back({cursor, it->start - cursor});
        cursor = it->start;
      }
      const uint64_t stop = std::min(end, it->stop);
      out.push_back({it->destination + (cursor - it->start), stop - cursor});
      cursor = stop;
    }

    if (cursor < end) out.push_back({cursor, end - cursor});
  }
  return out;
}

const std::vector<Entry>& RangeMap::entries() const { return entries_; }

Entry parseEntry(std::string_view line) {
  std::vector<uint64_t> n = IO::parseNumbers<uint64_t>(line);
  if (n.size() != 3)
    throw std::runtime_error("Invalid map entry: " + std::string(line));
  return Entry{n[0], n[1], n[1] + n[2]};
}

Input parseInput(std::string_view input) {
  std::vector<std::string_view> blocks = IO::splitBlocks(input);
  if (blocks.empty()) throw std::runtime_error("Empty almanac");

  Input parsed;
  parsed.seeds = IO::parseNumbers<uint64_t>(
      IO::stripPrefix(IO::trim(blocks[0]), "seeds:"));

  // Maps keep the order they appear in; the header line names them
  for (size_t b = 1; b < blocks.size(); ++b) {
    std::vector<std::string_view> rows = IO::lines(blocks[b]);
    if (rows.empty() || rows[0].find("map:") == std::string_view::npos)
      throw std::runtime_error("Expected map header, got: " +
                               std::string(rows.empty() ? "" : rows[0]));

    std::vector<Entry> entries;
    for (size_t i = 1; i < rows.size(); ++i)
      entries.push_back(parseEntry(rows[i]));
    parsed.almanac.emplace_back(std::move(entries));
  }
  return parsed;
}

uint64_t locate(const Almanac& almanac, uint64_t seed) {
  uint64_t v = seed;
  for (const auto& m : almanac) v = m.map(v);
  return v;
}

uint64_t lowestLocation(const std::vector<uint64_t>& seeds,
                        const Almanac& almanac) {
  uint64_t best = std::numeric_limits<uint64_t>::max();
  for (uint64_t s : seeds) best = std::min(best, locate(almanac, s));
  return best;
}

std::vector<SeedRange> seedRanges(const std::vector<uint64_t>& seeds) {
  if (seeds.size() % 2 != 0)
    throw std::runtime_error("Seed ranges need an even number of values");
  std::vector<SeedRange> ranges;
  for (size_t i = 0; i < seeds.size(); i += 2)
    ranges.push_back({seeds[i], seeds[i + 1]});
  return ranges;
}

uint64_t lowestLocationBruteForce(const std::vector<SeedRange>& ranges,
                                  const Almanac& almanac,
                                  Worker::WorkerBackend& worker) {
  return worker.minimum(ranges, [&almanac](uint64_t begin, uint64_t end) {
    uint64_t best = std::numeric_limits<uint64_t>::max();
    for (uint64_t s = begin; s < end; ++s)
      best = std::min(best, locate(almanac, s));
    return best;
  });
}

uint64_t lowestLocationRanges(const std::vector<SeedRange>& ranges,
                              const Almanac& almanac) {
  std::vector<SeedRange> current = ranges;
  for (const auto& m : almanac) current = m.mapRanges(current);

  uint64_t best = std::numeric_limits<uint64_t>::max();
  for (const auto& r : current)
    if (r.length > 0) best = std::min(best, r.start);
  return best;
}

Solver::Solver(std::unique_ptr<Worker::WorkerBackend> worker,
               const std::string& method)
    : worker_(std::move(worker)), method_(method) {
  if (method_ != "default" && method_ != "bruteforce" && method_ != "ranges")
    throw std::invalid_argument("Unknown day 5 method: " + method_);
  if (!worker_ && method_ != "ranges")
    throw std::invalid_argument("Brute force needs a worker");
}

std::vector<Model::Answer> Solver::solve(const std::string& input) {
  Input in = parseInput(input);
  std::vector<SeedRange> ranges = seedRanges(in.seeds);

  const uint64_t part1 = lowestLocation(in.seeds, in.almanac);
  const uint64_t part2 =
      method_ == "ranges"
          ? lowestLocationRanges(ranges, in.almanac)
          : lowestLocationBruteForce(ranges, in.almanac, *worker_);

  return {
      {1, "Lowest location number", static_cast<int64_t>(part1)},
      {2, "Lowest location number", static_cast<int64_t>(part2)},
  };
}

};  // namespace Day05
