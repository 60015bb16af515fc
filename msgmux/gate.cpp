#include "msgmux/gate.hpp"

namespace msgmux {

void ReadinessGate::Enable() {
  bool expected = false;
  if (!ready_.compare_exchange_strong(expected, true)) {
    return;  // Already open
  }
  Notify();
}

void ReadinessGate::Wait() {
  if (ready_.load()) {
    return;
  }
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this]() { return ready_.load(); });
}

Error ReadinessGate::Wait(const Context& ctx) {
  if (ready_.load()) {
    return Error::OK;
  }

  auto sub = ctx.OnCancel([this]() { Notify(); });

  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this, &ctx]() {
    return ready_.load() || aborted_.load() || ctx.Done();
  });

  if (ready_.load()) {
    return Error::OK;
  }
  if (aborted_.load()) {
    return Error::PoolClosed;
  }
  return ctx.Err();
}

void ReadinessGate::Abort() {
  aborted_.store(true);
  Notify();
}

void ReadinessGate::Notify() {
  // Taking the lock orders the flag store before any waiter's predicate
  // check, so no wake-up is lost.
  { std::lock_guard<std::mutex> lock(mtx_); }
  cv_.notify_all();
}

}  // namespace msgmux
