#ifndef MSGMUX_CONTEXT_HPP
#define MSGMUX_CONTEXT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "msgmux/errors.hpp"

namespace msgmux {

namespace detail {
struct ContextState;
}  // namespace detail

// Cancels the context it was returned with. Safe to call more than once.
using CancelFunc = std::function<void()>;

// Registration of a cancellation callback. Unregisters on destruction;
// if the callback is running on another thread, waits for it to return.
// Never drop one while holding a lock the callback takes.
class CancelSubscription {
 public:
  CancelSubscription() = default;
  ~CancelSubscription();

  CancelSubscription(CancelSubscription&& other) noexcept;
  CancelSubscription& operator=(CancelSubscription&& other) noexcept;
  CancelSubscription(const CancelSubscription&) = delete;
  CancelSubscription& operator=(const CancelSubscription&) = delete;

  // Unregister the callback now
  void Reset();

 private:
  friend class Context;
  CancelSubscription(std::shared_ptr<detail::ContextState> state, uint64_t id);

  std::shared_ptr<detail::ContextState> state_;
  uint64_t id_ = 0;
};

// A cancellation signal shared by every blocking operation of a pool.
// Contexts form a tree: cancelling a parent cancels all of its children.
// Copies refer to the same underlying signal.
class Context {
 public:
  using Clock = std::chrono::steady_clock;

  // Equivalent to Background()
  Context();

  // A context that is never cancelled
  static Context Background();

  // Derive a context cancelled by the returned function or by the parent
  static std::pair<Context, CancelFunc> WithCancel(const Context& parent);

  // Derive a context that is additionally cancelled with
  // Error::DeadlineExceeded once the timeout elapses
  static std::pair<Context, CancelFunc> WithTimeout(const Context& parent,
                                                    Clock::duration timeout);

  // True once the context is cancelled or its deadline passed
  bool Done() const;

  // Error::OK while live, otherwise the cancellation cause
  Error Err() const;

  // Deadline of this context or the nearest ancestor that has one
  std::optional<Clock::time_point> Deadline() const;

  // Register a callback run once when the context is cancelled. Blocking
  // primitives use it to wake their own condition variables. Nothing is
  // registered if the context can never be cancelled or is already done.
  CancelSubscription OnCancel(std::function<void()> fn) const;

  // Sleep for the given duration unless cancelled first.
  // Returns true if the context was cancelled.
  bool WaitFor(Clock::duration d) const;

 private:
  explicit Context(std::shared_ptr<detail::ContextState> state);

  std::shared_ptr<detail::ContextState> state_;
};

}  // namespace msgmux

#endif  // MSGMUX_CONTEXT_HPP
