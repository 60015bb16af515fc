#ifndef MSGMUX_BROADCAST_WRITER_HPP
#define MSGMUX_BROADCAST_WRITER_HPP

#include <memory>
#include <mutex>
#include <vector>

#include "msgmux/context.hpp"
#include "msgmux/gate.hpp"
#include "msgmux/pool.hpp"

namespace msgmux {

// Fan-out write pool: every message goes to every registered connection.
class BroadcastWriter : public WritePool {
 public:
  explicit BroadcastWriter(const Context& ctx, const PoolConfig& config = {});
  ~BroadcastWriter() override;

  BroadcastWriter(const BroadcastWriter&) = delete;
  BroadcastWriter& operator=(const BroadcastWriter&) = delete;

  Error AddConn(std::shared_ptr<MsgWriter> w) override;
  void RmConn(const std::shared_ptr<MsgWriter>& w) override;

  // Write the message to all registered connections concurrently and wait
  // for every write. Returns the first error; the other connections may
  // still have received the message. Connections whose write failed are
  // closed and removed afterwards.
  Error Write(const Context& ctx, const Msg& msg) override;

  // Close every connection in turn. Returns the first close error.
  Error Close() override;

  size_t NumConns() const override;

 private:
  Context ctx_;
  ReadinessGate gate_;

  mutable std::mutex mtx_;
  std::vector<std::shared_ptr<MsgWriter>> writers_;
  bool closed_ = false;
};

}  // namespace msgmux

#endif  // MSGMUX_BROADCAST_WRITER_HPP
