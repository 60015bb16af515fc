#ifndef MSGMUX_GATE_HPP
#define MSGMUX_GATE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>

#include "msgmux/context.hpp"
#include "msgmux/errors.hpp"

namespace msgmux {

// One-shot latch that holds back reads and writes on a pool until its
// first connection is registered. Once enabled it stays open for the
// lifetime of the gate.
class ReadinessGate {
 public:
  ReadinessGate() = default;

  ReadinessGate(const ReadinessGate&) = delete;
  ReadinessGate& operator=(const ReadinessGate&) = delete;

  // Open the gate. Idempotent and safe to call concurrently.
  void Enable();

  // Block until the gate is open.
  void Wait();

  // Block until the gate is open, the context is cancelled, or the gate
  // is aborted. Returns Error::OK once open, the context error on
  // cancellation and Error::PoolClosed when aborted.
  Error Wait(const Context& ctx);

  // Release every current and future waiter with Error::PoolClosed.
  // Does not open the gate.
  void Abort();

  bool IsReady() const { return ready_.load(); }

 private:
  void Notify();

  std::mutex mtx_;
  std::condition_variable cv_;
  std::atomic<bool> ready_{false};
  std::atomic<bool> aborted_{false};
};

}  // namespace msgmux

#endif  // MSGMUX_GATE_HPP
