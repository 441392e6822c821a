/**
 * @file worker_pool.hpp
 * @brief Fixed size thread pool executing asynchronous dispatches.
 */
#ifndef OCTOCLIENT_WORKER_POOL_HPP
#define OCTOCLIENT_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace octo {

/**
 * Runs submitted jobs on a set of worker threads.
 *
 * Jobs submitted while the pool is stopped run inline on the caller's
 * thread.
 */
class WorkerPool {
public:
  /**
   * @param workers Number of worker threads, at least one.
   */
  explicit WorkerPool(int workers = 4);

  /// Destructor stops the worker threads after draining queued jobs.
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Start the worker threads.
  void start();

  /// Run the jobs still queued, then join the worker threads.
  void stop();

  bool running() const { return running_; }

  int workers() const { return workers_; }

  /// Jobs queued or executing.
  std::size_t outstanding_jobs() const {
    return queued_.load(std::memory_order_relaxed) +
           in_flight_.load(std::memory_order_relaxed);
  }

  /**
   * Submit a job to the worker queue.
   *
   * @param job Callable executed on a worker thread.
   * @return Future holding the job's result or exception.
   */
  template <typename F>
  std::future<std::invoke_result_t<F>> submit(F job) {
    using R = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(job));
    std::future<R> fut = task->get_future();
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (running_) {
        jobs_.emplace([task]() { (*task)(); });
        queued_.fetch_add(1, std::memory_order_relaxed);
        lock.unlock();
        cv_.notify_one();
        return fut;
      }
    }
    (*task)();
    return fut;
  }

private:
  void worker();

  int workers_;
  std::atomic<bool> running_{false};
  std::vector<std::thread> threads_;
  std::queue<std::function<void()>> jobs_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<std::size_t> queued_{0};
  std::atomic<std::size_t> in_flight_{0};
};

} // namespace octo

#endif // OCTOCLIENT_WORKER_POOL_HPP
