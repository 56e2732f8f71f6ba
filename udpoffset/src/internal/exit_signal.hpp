// Copyright (c) 2025
/**
 * @file exit_signal.hpp
 * @brief One-shot termination signal shared by a component's loops.
 *
 * A loop that hits a fatal error, or Stop(), raises the signal. Loops that
 * sleep between iterations wait on it so they wake immediately, and the
 * owner's Wait() blocks on it to observe how the session ended.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace udpoffset {
namespace internal {

class ExitSignal {
 public:
  /** Re-arms the signal for a new session. */
  void Reset() {
    std::lock_guard<std::mutex> lk(mtx_);
    raised_ = false;
    fatal_ = false;
  }

  /**
   * @brief Raises the signal and wakes all waiters.
   * @param fatal True if raised by an unrecoverable error. A fatal raise is
   *        sticky: a later Stop() does not clear it.
   */
  void Raise(bool fatal) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      raised_ = true;
      fatal_ = fatal_ || fatal;
    }
    cv_.notify_all();
  }

  /**
   * @brief Sleeps up to timeout, returning early if the signal is raised.
   * @return true if the signal was raised.
   */
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this]() { return raised_; });
  }

  /**
   * @brief Blocks until the signal is raised.
   * @return true if the session ended without a fatal error.
   */
  bool Wait() {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this]() { return raised_; });
    return !fatal_;
  }

 private:
  std::mutex mtx_;
  std::condition_variable cv_;
  bool raised_ = false;
  bool fatal_ = false;
};

}  // namespace internal
}  // namespace udpoffset
