#include "worker_pool.hpp"
#include <algorithm>

namespace octo {

WorkerPool::WorkerPool(int workers) : workers_(std::max(1, workers)) {}

/**
 * Stop the worker pool on destruction.
 */
WorkerPool::~WorkerPool() { stop(); }

/**
 * Start worker threads if not already running.
 */
void WorkerPool::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_)
    return;
  running_ = true;
  threads_.reserve(workers_);
  for (int i = 0; i < workers_; ++i) {
    threads_.emplace_back(&WorkerPool::worker, this);
  }
}

/**
 * Stop accepting jobs, let the workers drain the queue and join them.
 */
void WorkerPool::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
      return;
    running_ = false;
  }
  cv_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
}

void WorkerPool::worker() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
      if (jobs_.empty())
        return;
      job = std::move(jobs_.front());
      jobs_.pop();
      queued_.fetch_sub(1, std::memory_order_relaxed);
      in_flight_.fetch_add(1, std::memory_order_relaxed);
    }
    job();
    in_flight_.fetch_sub(1, std::memory_order_relaxed);
  }
}

} // namespace octo
