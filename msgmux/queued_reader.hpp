#ifndef MSGMUX_QUEUED_READER_HPP
#define MSGMUX_QUEUED_READER_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "msgmux/context.hpp"
#include "msgmux/gate.hpp"
#include "msgmux/pool.hpp"
#include "msgmux/queue.hpp"

namespace msgmux {

// Fan-in read pool. One worker thread per connection reads messages into
// a shared bounded queue; Read() hands them out in arrival order.
// Messages from one connection keep their order; there is no fairness
// between connections.
//
// A connection whose read fails delivers the failed message once, then
// its worker closes it and removes it from the pool.
class QueuedReader : public ReadPool {
 public:
  explicit QueuedReader(const Context& ctx, const PoolConfig& config = {});
  ~QueuedReader() override;

  QueuedReader(const QueuedReader&) = delete;
  QueuedReader& operator=(const QueuedReader&) = delete;

  Error AddConn(std::shared_ptr<MsgReader> r) override;
  void RmConn(const std::shared_ptr<MsgReader>& r) override;
  Error Read(const Context& ctx, Msg* msg) override;

  // Close all registered readers concurrently, stop and join every worker.
  // Returns the first close error. Calling it again returns Error::OK.
  Error Close() override;

  size_t NumConns() const override;

  // Number of worker threads still running
  size_t NumWorkers() const { return live_workers_.load(); }

  bool IsClosed() const { return closed_.load(); }

 private:
  struct Worker {
    std::shared_ptr<MsgReader> reader;
    std::thread thread;
  };

  // Worker loop for one reader
  void Listen(std::shared_ptr<MsgReader> r);

  // Join the threads of workers that already exited
  void Reap();

  Context ctx_;
  CancelFunc cancel_;
  BoundedQueue<Msg> queue_;
  ReadinessGate gate_;

  mutable std::mutex mtx_;
  std::vector<std::shared_ptr<MsgReader>> readers_;
  std::vector<Worker> workers_;
  // Threads of exited workers, joined by Reap() or Close()
  std::vector<std::thread> finished_;
  std::atomic<bool> closed_{false};
  std::atomic<size_t> live_workers_{0};
};

}  // namespace msgmux

#endif  // MSGMUX_QUEUED_READER_HPP
