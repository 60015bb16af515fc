#ifndef MSGMUX_CONNECTION_HPP
#define MSGMUX_CONNECTION_HPP

#include <string>

#include "msgmux/context.hpp"
#include "msgmux/errors.hpp"
#include "msgmux/message.hpp"

namespace msgmux {

// Abstract interface for a message-oriented transport connection.
// Implementations arrive already handshaken and security-wrapped; framing
// and encryption happen below this interface.
class Connection {
public:
  virtual ~Connection() = default;

  // Read one complete message from the connection.
  // This is a blocking call. On failure the returned message carries the
  // error in its err field (peer closed, transport error, ...).
  virtual Msg Read(const Context &ctx) = 0;

  // Write one complete message to the connection.
  // Returns Error::OK on success, or an error code on failure.
  // This is a blocking call that writes the whole message or fails.
  virtual Error Write(const Context &ctx, const Msg &msg) = 0;

  // Close the connection. May be called while Read or Write blocks on
  // another thread and must make them return.
  virtual Error Close() = 0;

  // Check if the connection is closed.
  virtual bool IsClosed() const = 0;

  // Label used in log lines (typically the peer address).
  virtual std::string Name() const { return "conn"; }
};

} // namespace msgmux

#endif // MSGMUX_CONNECTION_HPP
