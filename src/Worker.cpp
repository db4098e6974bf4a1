#include "../include/Worker.hpp"

#include <algorithm>
#include <condition_variable>
#include <future>
#include <limits>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>

using Worker::SeedRange;

// -----------------------------------------------------------------------------
// Minimal internal thread pool used by ThreadWorker
// -----------------------------------------------------------------------------
// Kept local to this translation unit so threading primitives stay out of the
// public header. Executes generic R() jobs through packaged_task.
namespace {
class ThreadPool {
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex m_;
  std::condition_variable cv_;
  bool stop_{false};

 public:
  explicit ThreadPool(std::size_t n) {
    const std::size_t count = (n == 0) ? 1 : n;
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      workers_.emplace_back([this]() {
        for (;;) {
          std::function<void()> task;
          {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [this]() { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;  // graceful shutdown
            task = std::move(tasks_.front());
            tasks_.pop();
          }
          task();
        }
      });
    }
  }

  ~ThreadPool() {
    {
      std::lock_guard<std::mutex> lk(m_);
      stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) if (t.joinable()) t.join();
  }

  template <class F>
  auto enqueue(F&& f) -> std::future<decltype(f())> {
    using R = decltype(f());
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> fut = task->get_future();
    {
      std::lock_guard<std::mutex> lk(m_);
      tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }
};

constexpr uint64_t kNone = std::numeric_limits<uint64_t>::max();
}  // anonymous namespace

namespace Worker {
// DirectWorker implementation

uint64_t DirectWorker::minimum(const std::vector<SeedRange>& ranges,
                               const SliceFn& fn) {
  uint64_t best = kNone;
  for (const auto& r : ranges) {
    if (r.length == 0) continue;
    best = std::min(best, fn(r.start, r.start + r.length));
  }
  return best;
}

// ThreadWorker implementation
//
// - Every range is cut into slices of at most sliceSize_ values.
// - One task per slice; tasks never overlap, so no locking is needed around fn.
// - Futures are drained in submission order and reduced with min, which is
//   commutative, so completion order does not matter.
ThreadWorker::ThreadWorker(std::size_t poolSize, uint64_t sliceSize)
    : poolSize_(poolSize), sliceSize_(sliceSize == 0 ? 1 : sliceSize) {
  if (poolSize_ == 0) {
    poolSize_ = std::thread::hardware_concurrency();
    if (poolSize_ == 0) poolSize_ = 1;
  }
}

std::size_t ThreadWorker::poolSize() const { return poolSize_; }

uint64_t ThreadWorker::minimum(const std::vector<SeedRange>& ranges,
                               const SliceFn& fn) {
  ThreadPool pool(poolSize_);

  std::vector<std::future<uint64_t>> futures;
  for (const auto& r : ranges) {
    uint64_t begin = r.start;
    const uint64_t end = r.start + r.length;
    while (begin < end) {
      const uint64_t stop = std::min(end, begin + sliceSize_);
      futures.emplace_back(
          pool.enqueue([&fn, begin, stop]() { return fn(begin, stop); }));
      begin = stop;
    }
  }

  uint64_t best = kNone;
  for (auto& f : futures) best = std::min(best, f.get());
  return best;
}

};  // namespace Worker
