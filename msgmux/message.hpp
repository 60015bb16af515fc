#ifndef MSGMUX_MESSAGE_HPP
#define MSGMUX_MESSAGE_HPP

#include <initializer_list>
#include <string>
#include <vector>

#include "msgmux/errors.hpp"
#include "msgmux/types.hpp"

namespace msgmux {

// A complete message: an ordered list of frames plus the failure (if any)
// of the read that produced it.
struct Msg {
  std::vector<Bytes> frames;
  MsgType type = MsgType::User;
  Error err = Error::OK;

  // True if the message carries no failure
  bool ok() const { return err == Error::OK; }

  // True if the message has more than one frame
  bool Multipart() const { return frames.size() > 1; }

  // All frames concatenated
  Bytes Payload() const;

  // Debug rendering: Msg{Frames:{"a", "b"}}
  std::string String() const;

  // Deep copy
  Msg Clone() const;
};

bool operator==(const Msg &a, const Msg &b);
bool operator!=(const Msg &a, const Msg &b);

// Single-frame user message
Msg NewMsg(Bytes data);

// Single-frame user message from a string
Msg NewMsgString(const std::string &data);

// Multi-frame user message
Msg NewMsgFrom(std::vector<Bytes> frames);

// Multi-frame user message from strings
Msg NewMsgFromString(std::initializer_list<std::string> frames);
Msg NewMsgFromString(const std::vector<std::string> &frames);

// Single-frame command message
Msg NewCmdMsg(Bytes data);

// Empty message carrying a failure
Msg ErrMsg(Error err);

} // namespace msgmux

#endif // MSGMUX_MESSAGE_HPP
