#ifndef WORKER_HPP
#define WORKER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace Worker {
// Half-open range [start, start + length)
struct SeedRange {
  uint64_t start{};
  uint64_t length{};
};

// Minimum of the mapped values over [begin, end)
using SliceFn = std::function<uint64_t(uint64_t begin, uint64_t end)>;

// Common interface for all workers
class WorkerBackend {
 public:
  virtual ~WorkerBackend() = default;

  // Map every value of every range and reduce by taking the minimum.
  // Returns UINT64_MAX when there is nothing to map.
  virtual uint64_t minimum(const std::vector<SeedRange>& ranges,
                           const SliceFn& fn) = 0;
};

// Single threaded worker, one call per range
class DirectWorker : public WorkerBackend {
 public:
  uint64_t minimum(const std::vector<SeedRange>& ranges,
                   const SliceFn& fn) override;
};

// Splits the ranges into disjoint slices and maps them on a fixed-size pool.
//
// Safety
// - fn is shared by all tasks and must only read captured state.
// - Each task returns its own minimum; the reduction happens on the calling
//   thread after every future is ready.
class ThreadWorker : public WorkerBackend {
 private:
  std::size_t poolSize_{0};
  uint64_t sliceSize_{0};

 public:
  static constexpr uint64_t kDefaultSliceSize = 1u << 22;

  // poolSize 0 picks std::thread::hardware_concurrency()
  explicit ThreadWorker(std::size_t poolSize,
                        uint64_t sliceSize = kDefaultSliceSize);

  std::size_t poolSize() const;

  uint64_t minimum(const std::vector<SeedRange>& ranges,
                   const SliceFn& fn) override;
};

};  // namespace Worker

#endif
