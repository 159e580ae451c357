#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <latch>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace weld::common {

// Fixed set of worker threads draining one FIFO task queue.
//
// Map() is the only way the pipeline uses the pool: it runs a pure function
// for every index and hands the results back in index order, so callers can
// fold them sequentially and never observe completion order.
class WorkerPool {
 public:
  // thread_count == 0 picks the hardware concurrency (at least one thread).
  explicit WorkerPool(size_t thread_count = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  auto operator=(const WorkerPool&) -> WorkerPool& = delete;
  WorkerPool(WorkerPool&&) = delete;
  auto operator=(WorkerPool&&) -> WorkerPool& = delete;

  [[nodiscard]] auto ThreadCount() const -> size_t {
    return workers_.size();
  }

  void Submit(std::function<void()> task);

  // Runs fn(i) for every i in [0, count) and returns the results in index
  // order. Blocks until every task finished. If any call throws, the
  // exception of the lowest failing index is rethrown after the batch
  // completes. Must not be called from a worker thread.
  template <typename Fn>
  auto Map(size_t count, Fn&& fn)
      -> std::vector<std::invoke_result_t<Fn&, size_t>> {
    using R = std::invoke_result_t<Fn&, size_t>;

    std::vector<std::optional<R>> slots(count);
    std::vector<std::exception_ptr> failures(count);
    std::latch done(static_cast<std::ptrdiff_t>(count));

    for (size_t i = 0; i < count; ++i) {
      Submit([&, i] {
        try {
          slots[i].emplace(fn(i));
        } catch (...) {
          failures[i] = std::current_exception();
        }
        done.count_down();
      });
    }
    done.wait();

    for (const auto& failure : failures) {
      if (failure) {
        std::rethrow_exception(failure);
      }
    }

    std::vector<R> results;
    results.reserve(count);
    for (auto& slot : slots) {
      results.push_back(std::move(*slot));
    }
    return results;
  }

 private:
  void WorkerLoop(std::stop_token stop_token);

  std::mutex mutex_;
  std::condition_variable_any cv_;
  std::deque<std::function<void()>> tasks_;
  std::vector<std::jthread> workers_;
};

}  // namespace weld::common
