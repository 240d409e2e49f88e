#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <vector>

// Lock-free single-producer/single-consumer ring. The producer side is safe
// to call from an audio callback: no locks, no allocation.
template <typename T>
class SpscRing
{
public:
  explicit SpscRing(size_t capacity) : buffer_(capacity + 1) {}

  SpscRing(const SpscRing &) = delete;
  SpscRing &operator=(const SpscRing &) = delete;

  // Returns the number of items written; the rest did not fit.
  size_t push(const T *items, size_t count)
  {
    const size_t write = writePos_.load(std::memory_order_relaxed);
    const size_t read = readPos_.load(std::memory_order_acquire);
    const size_t n = std::min(count, freeSpace(read, write));
    for (size_t i = 0; i < n; ++i)
    {
      buffer_[(write + i) % buffer_.size()] = items[i];
    }
    writePos_.store((write + n) % buffer_.size(), std::memory_order_release);
    return n;
  }

  size_t pop(T *out, size_t count)
  {
    const size_t read = readPos_.load(std::memory_order_relaxed);
    const size_t write = writePos_.load(std::memory_order_acquire);
    const size_t n = std::min(count, used(read, write));
    for (size_t i = 0; i < n; ++i)
    {
      out[i] = buffer_[(read + i) % buffer_.size()];
    }
    readPos_.store((read + n) % buffer_.size(), std::memory_order_release);
    return n;
  }

  size_t available() const
  {
    return used(readPos_.load(std::memory_order_acquire), writePos_.load(std::memory_order_acquire));
  }

  // Consumer side only.
  void clear()
  {
    readPos_.store(writePos_.load(std::memory_order_acquire), std::memory_order_release);
  }

  size_t capacity() const { return buffer_.size() - 1; }

private:
  std::vector<T> buffer_;
  std::atomic<size_t> writePos_{0};
  std::atomic<size_t> readPos_{0};

  size_t used(size_t read, size_t write) const
  {
    return (write + buffer_.size() - read) % buffer_.size();
  }

  size_t freeSpace(size_t read, size_t write) const
  {
    return buffer_.size() - 1 - used(read, write);
  }
};
