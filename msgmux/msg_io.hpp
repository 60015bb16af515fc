#ifndef MSGMUX_MSG_IO_HPP
#define MSGMUX_MSG_IO_HPP

#include <atomic>
#include <memory>
#include <string>

#include "msgmux/connection.hpp"
#include "msgmux/context.hpp"
#include "msgmux/errors.hpp"
#include "msgmux/message.hpp"
#include "msgmux/types.hpp"

namespace msgmux {

// Reads complete messages from one connection.
// Owns the connection; closing the reader closes it.
class MsgReader {
 public:
  explicit MsgReader(std::unique_ptr<Connection> conn);
  ~MsgReader();

  MsgReader(const MsgReader&) = delete;
  MsgReader& operator=(const MsgReader&) = delete;

  // Read one message. On failure *msg carries the error as well.
  Error Read(const Context& ctx, Msg* msg);

  // Close the underlying connection. Only the first call closes it;
  // later calls return Error::OK.
  Error Close();

  bool IsClosed() const { return closed_.load(); }
  AdapterID Id() const { return id_; }
  std::string Name() const;

 private:
  std::unique_ptr<Connection> conn_;
  AdapterID id_;
  std::atomic<bool> closed_{false};
};

// Writes complete messages to one connection.
// Owns the connection; closing the writer closes it.
class MsgWriter {
 public:
  explicit MsgWriter(std::unique_ptr<Connection> conn);
  ~MsgWriter();

  MsgWriter(const MsgWriter&) = delete;
  MsgWriter& operator=(const MsgWriter&) = delete;

  // Write one message
  Error Write(const Context& ctx, const Msg& msg);

  // Close the underlying connection. Only the first call closes it;
  // later calls return Error::OK.
  Error Close();

  bool IsClosed() const { return closed_.load(); }
  AdapterID Id() const { return id_; }
  std::string Name() const;

 private:
  std::unique_ptr<Connection> conn_;
  AdapterID id_;
  std::atomic<bool> closed_{false};
};

} // namespace msgmux

#endif // MSGMUX_MSG_IO_HPP
