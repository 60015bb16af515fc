#ifndef MSGMUX_QUEUE_HPP
#define MSGMUX_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

#include "msgmux/context.hpp"
#include "msgmux/errors.hpp"

namespace msgmux {

// Bounded multi-producer multi-consumer FIFO. Every blocking call observes
// the caller's context.
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(size_t capacity)
      : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Append an item, blocking while the queue is full.
  // Returns Error::QueueClosed once closed, or the context error.
  Error Push(const Context& ctx, T item) {
    if (ctx.Done()) {
      return ctx.Err();
    }

    auto sub = ctx.OnCancel([this]() { WakeAll(); });

    std::unique_lock<std::mutex> lock(mtx_);
    not_full_.wait(lock, [this, &ctx]() {
      return closed_ || items_.size() < capacity_ || ctx.Done();
    });

    if (closed_) {
      return Error::QueueClosed;
    }
    if (ctx.Done()) {
      return ctx.Err();
    }

    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return Error::OK;
  }

  // Append an item regardless of the capacity bound. Used to hand a
  // failed item back without waiting on consumers.
  Error Requeue(T item) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_) {
        return Error::QueueClosed;
      }
      items_.push_back(std::move(item));
    }
    not_empty_.notify_one();
    return Error::OK;
  }

  // Remove the oldest item, blocking while the queue is empty.
  // A closed queue still hands out its remaining items before failing
  // with Error::QueueClosed.
  Result<T> Pop(const Context& ctx) {
    if (ctx.Done()) {
      return {T{}, ctx.Err()};
    }

    auto sub = ctx.OnCancel([this]() { WakeAll(); });

    std::unique_lock<std::mutex> lock(mtx_);
    not_empty_.wait(lock, [this, &ctx]() {
      return !items_.empty() || closed_ || ctx.Done();
    });

    if (ctx.Done()) {
      return {T{}, ctx.Err()};
    }
    if (items_.empty()) {
      return {T{}, Error::QueueClosed};
    }

    T item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return {std::move(item), Error::OK};
  }

  // Close the queue and wake every waiter. Idempotent.
  void Close() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
    }
    WakeAll();
  }

  // Remove and return every queued item
  std::deque<T> Drain() {
    std::deque<T> out;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      out.swap(items_);
    }
    not_full_.notify_all();
    return out;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
  }

  size_t Capacity() const { return capacity_; }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

 private:
  void WakeAll() {
    { std::lock_guard<std::mutex> lock(mtx_); }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  const size_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_ = false;
};

}  // namespace msgmux

#endif  // MSGMUX_QUEUE_HPP
