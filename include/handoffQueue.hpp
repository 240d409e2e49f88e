#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>

// Blocking queue used to pass results from the capture thread to the
// conversation thread. A producer that cannot continue calls fail(); queued
// items are still delivered first, then pop() rethrows the error.
template <typename T>
class HandoffQueue
{
public:
  void push(T value)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      items_.push_back(std::move(value));
    }
    cv_.notify_one();
  }

  void fail(std::exception_ptr error)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!error_)
      {
        error_ = std::move(error);
      }
    }
    cv_.notify_all();
  }

  template <typename Rep, typename Period>
  std::optional<T> pop(std::chrono::duration<Rep, Period> timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty() || error_; }))
    {
      return std::nullopt;
    }
    if (items_.empty())
    {
      std::rethrow_exception(error_);
    }
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  std::optional<T> tryPop()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty())
    {
      return std::nullopt;
    }
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  std::exception_ptr error_;
};
