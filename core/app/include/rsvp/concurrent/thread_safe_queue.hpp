#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace rsvp {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: FIFO hand-off between threads. Notifications committed on
// any thread are pushed here and drained by the IpcServer thread, which
// serializes and publishes them. The drain never blocks: the IPC thread
// polls the queue between command receives.
//
// Capacity: with a non-zero capacity, push() on a full queue evicts the
// oldest item and counts it in dropped(). Capacity 0 means unbounded.
//
// Thread model: Any number of producers and consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Appends one item, evicting the oldest when full.
  void push(T value) {
    std::lock_guard guard(mutex_);
    if (capacity_ != 0 && items_.size() >= capacity_) {
      items_.pop_front();
      ++dropped_;
    }
    items_.push_back(std::move(value));
  }

  // Front item, or nullopt when empty. Never blocks.
  std::optional<T> try_pop() {
    std::lock_guard guard(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    T front = std::move(items_.front());
    items_.pop_front();
    return front;
  }

  bool empty() const {
    std::lock_guard guard(mutex_);
    return items_.empty();
  }

  std::size_t size() const {
    std::lock_guard guard(mutex_);
    return items_.size();
  }

  // Items evicted by push() on a full queue since construction.
  std::size_t dropped() const {
    std::lock_guard guard(mutex_);
    return dropped_;
  }

 private:
  mutable std::mutex mutex_;
  std::deque<T> items_;
  const std::size_t capacity_;
  std::size_t dropped_{0};
};

}  // namespace rsvp
