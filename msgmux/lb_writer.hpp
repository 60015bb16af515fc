#ifndef MSGMUX_LB_WRITER_HPP
#define MSGMUX_LB_WRITER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "msgmux/context.hpp"
#include "msgmux/gate.hpp"
#include "msgmux/pool.hpp"
#include "msgmux/queue.hpp"

namespace msgmux {

// Load-balanced write pool. Messages go through one shared bounded queue;
// each connection has a worker that pulls the next message and writes it.
// A message whose write fails is handed back to the queue so another
// worker (or the same one) retries it.
//
// With the default PoolConfig a message is retried until it is delivered:
// if the only connection always fails, the message circulates forever.
// max_retries and evict_after_failures bound this.
class LoadBalancedWriter : public WritePool {
 public:
  struct Stats {
    uint64_t delivered = 0;
    uint64_t failed_attempts = 0;
    uint64_t dropped = 0;
    uint64_t evicted = 0;
  };

  explicit LoadBalancedWriter(const Context& ctx,
                              const PoolConfig& config = {});
  ~LoadBalancedWriter() override;

  LoadBalancedWriter(const LoadBalancedWriter&) = delete;
  LoadBalancedWriter& operator=(const LoadBalancedWriter&) = delete;

  Error AddConn(std::shared_ptr<MsgWriter> w) override;

  // Stop the connection's worker and remove it. The worker closes the
  // writer once its current write, if any, is done.
  void RmConn(const std::shared_ptr<MsgWriter>& w) override;

  // Enqueue the message for delivery. Returns once it is queued; delivery
  // happens asynchronously.
  Error Write(const Context& ctx, const Msg& msg) override;

  // Close the queue, stop and join every worker, close every connection.
  // Messages still queued are discarded.
  Error Close() override;

  size_t NumConns() const override;

  // Messages waiting in the queue
  size_t Pending() const { return queue_.Size(); }

  // Number of worker threads still running
  size_t NumWorkers() const { return live_workers_.load(); }

  Stats GetStats() const;

 private:
  struct Envelope {
    Msg msg;
    uint32_t attempts = 0;
  };

  struct Worker {
    std::shared_ptr<MsgWriter> writer;
    Context ctx;
    CancelFunc cancel;
    uint32_t consecutive_failures = 0;
  };

  // Worker loop for one connection
  void Listen(std::shared_ptr<Worker> worker);

  // Requeue a failed message, or drop it once it ran out of retries
  void Retry(Envelope env);

  // Remove the worker from the registry if it is still registered
  bool Unregister(const std::shared_ptr<Worker>& worker);

  // Join the threads of workers that already exited
  void Reap();

  Context ctx_;
  CancelFunc cancel_;
  PoolConfig config_;
  BoundedQueue<Envelope> queue_;
  ReadinessGate gate_;

  mutable std::mutex mtx_;
  std::unordered_map<AdapterID, std::shared_ptr<Worker>> workers_;
  std::unordered_map<const Worker*, std::thread> threads_;
  // Threads of exited workers, joined by Reap() or Close()
  std::vector<std::thread> finished_;
  bool closed_ = false;

  std::atomic<size_t> live_workers_{0};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> failed_attempts_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> evicted_{0};
};

}  // namespace msgmux

#endif  // MSGMUX_LB_WRITER_HPP
