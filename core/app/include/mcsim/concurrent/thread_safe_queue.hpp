#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace mcsim {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between threads. Blocking pop()
// waits for an item; try_pop() returns immediately.
//
// Where it sits: the host thread pushes SimulationRequests into the
// SimulationWorker's inbox; the worker thread's subscribers push events into
// the SimulationServer's outbound queue; the CLI collects completion
// events from the worker the same way.
//
// Thread model: Multiple producers and consumers; every method locks.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // std::mutex and std::condition_variable are neither copyable nor movable;
  // share the queue by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends to the back and wakes one blocked pop().
  // Input: value, taken by value so callers can std::move large items
  // (a ProgressEvent batch, a SimulationRequest's price history).
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer does not immediately
    // block on mutex_.
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // What: Waits until the queue is non-empty, then removes and returns the
  // front item. The predicate loop handles spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
  // What: Front item if there is one, std::nullopt otherwise.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // clear()
  // -------------------------------------------------------------------------
  // What: Drops every queued item and returns how many were dropped. Used
  // on shutdown to discard requests that never started.
  // -------------------------------------------------------------------------
  std::size_t clear() {
    std::lock_guard lock(mutex_);
    std::size_t dropped = queue_.size();
    queue_.clear();
    return dropped;
  }

  // Snapshot only; another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  // Snapshot only.
  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  // mutable so the const snapshot accessors can lock.
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace mcsim
