#include "weld/common/worker_pool.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

namespace weld::common {

WorkerPool::WorkerPool(size_t thread_count) {
  if (thread_count == 0) {
    thread_count = std::max<size_t>(1, std::thread::hardware_concurrency());
  }
  workers_.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    workers_.emplace_back(
        [this](std::stop_token st) { WorkerLoop(std::move(st)); });
  }
}

WorkerPool::~WorkerPool() {
  for (auto& worker : workers_) {
    worker.request_stop();
  }
  cv_.notify_all();
  // jthread destructors join
  workers_.clear();
}

void WorkerPool::Submit(std::function<void()> task) {
  {
    std::scoped_lock lock(mutex_);
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void WorkerPool::WorkerLoop(std::stop_token stop_token) {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock lock(mutex_);
      if (!cv_.wait(lock, stop_token, [this] { return !tasks_.empty(); })) {
        return;  // Stop requested with an empty queue
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }
    task();
  }
}

}  // namespace weld::common
