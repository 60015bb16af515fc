#ifndef MSGMUX_POOL_HPP
#define MSGMUX_POOL_HPP

#include <memory>

#include "msgmux/context.hpp"
#include "msgmux/errors.hpp"
#include "msgmux/message.hpp"
#include "msgmux/msg_io.hpp"
#include "msgmux/types.hpp"

namespace msgmux {

// Reads messages from a pool of connections.
class ReadPool {
public:
  virtual ~ReadPool() = default;

  // Register a connection. The pool takes part in the reader's lifetime
  // from here on. Returns Error::PoolClosed (and closes the reader) if
  // the pool is already closed.
  virtual Error AddConn(std::shared_ptr<MsgReader> r) = 0;

  // Deregister a connection without closing it
  virtual void RmConn(const std::shared_ptr<MsgReader> &r) = 0;

  // Read the next message from any connection. Blocks until a connection
  // exists and a message is available, or the context is cancelled.
  virtual Error Read(const Context &ctx, Msg *msg) = 0;

  // Close every registered connection
  virtual Error Close() = 0;

  // Number of registered connections
  virtual size_t NumConns() const = 0;
};

// Writes messages to a pool of connections.
class WritePool {
public:
  virtual ~WritePool() = default;

  // Register a connection. Returns Error::PoolClosed (and closes the
  // writer) if the pool is already closed.
  virtual Error AddConn(std::shared_ptr<MsgWriter> w) = 0;

  // Deregister a connection
  virtual void RmConn(const std::shared_ptr<MsgWriter> &w) = 0;

  // Write a message according to the pool's distribution strategy.
  // Blocks until a connection exists.
  virtual Error Write(const Context &ctx, const Msg &msg) = 0;

  // Close the pool and its connections
  virtual Error Close() = 0;

  // Number of registered connections
  virtual size_t NumConns() const = 0;
};

// Create the fan-in read pool
std::unique_ptr<ReadPool> NewReadPool(const Context &ctx,
                                      const PoolConfig &config = {});

// Create a write pool for the given distribution strategy
std::unique_ptr<WritePool> NewWritePool(WriteStrategy strategy,
                                        const Context &ctx,
                                        const PoolConfig &config = {});

} // namespace msgmux

#endif // MSGMUX_POOL_HPP
