/**
 * @file cancellation.hpp
 * @brief Cancellation token shared between a caller and an in-flight dispatch.
 */
#ifndef OCTOCLIENT_CANCELLATION_HPP
#define OCTOCLIENT_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace octo {

/**
 * Shared flag used to abandon backoff waits.
 *
 * Copies share state, so a token handed to send_async() can be cancelled by
 * the caller while the dispatch runs on a worker thread.
 */
class CancellationToken {
public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  /// Request cancellation and wake every waiter.
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
  }

  /**
   * Block for @p delay or until cancelled.
   *
   * @return `true` when woken by cancellation.
   */
  bool wait_for(std::chrono::milliseconds delay) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, delay,
                               [this] { return state_->cancelled; });
  }

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
  };
  std::shared_ptr<State> state_;
};

} // namespace octo

#endif // OCTOCLIENT_CANCELLATION_HPP
