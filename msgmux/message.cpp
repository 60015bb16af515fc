#include "msgmux/message.hpp"

#include <iterator>

#include <fmt/format.h>

namespace msgmux {

Bytes Msg::Payload() const {
  Bytes out;
  size_t total = 0;
  for (const auto &frame : frames) {
    total += frame.size();
  }
  out.reserve(total);
  for (const auto &frame : frames) {
    out.insert(out.end(), frame.begin(), frame.end());
  }
  return out;
}

std::string Msg::String() const {
  fmt::memory_buffer buf;
  fmt::format_to(std::back_inserter(buf), "Msg{{");
  if (type != MsgType::User) {
    fmt::format_to(std::back_inserter(buf), "Type:{}, ", MsgTypeString(type));
  }
  fmt::format_to(std::back_inserter(buf), "Frames:{{");
  for (size_t i = 0; i < frames.size(); ++i) {
    if (i > 0) {
      fmt::format_to(std::back_inserter(buf), ", ");
    }
    std::string text(frames[i].begin(), frames[i].end());
    fmt::format_to(std::back_inserter(buf), "\"{}\"", text);
  }
  fmt::format_to(std::back_inserter(buf), "}}");
  if (err != Error::OK) {
    fmt::format_to(std::back_inserter(buf), ", Err:{}", ErrorString(err));
  }
  fmt::format_to(std::back_inserter(buf), "}}");
  return fmt::to_string(buf);
}

Msg Msg::Clone() const {
  Msg out;
  out.frames.reserve(frames.size());
  for (const auto &frame : frames) {
    out.frames.emplace_back(frame.begin(), frame.end());
  }
  out.type = type;
  out.err = err;
  return out;
}

bool operator==(const Msg &a, const Msg &b) {
  return a.type == b.type && a.frames == b.frames;
}

bool operator!=(const Msg &a, const Msg &b) { return !(a == b); }

Msg NewMsg(Bytes data) {
  Msg msg;
  msg.frames.push_back(std::move(data));
  return msg;
}

Msg NewMsgString(const std::string &data) {
  return NewMsg(Bytes(data.begin(), data.end()));
}

Msg NewMsgFrom(std::vector<Bytes> frames) {
  Msg msg;
  msg.frames = std::move(frames);
  return msg;
}

Msg NewMsgFromString(std::initializer_list<std::string> frames) {
  return NewMsgFromString(std::vector<std::string>(frames));
}

Msg NewMsgFromString(const std::vector<std::string> &frames) {
  Msg msg;
  msg.frames.reserve(frames.size());
  for (const auto &frame : frames) {
    msg.frames.emplace_back(frame.begin(), frame.end());
  }
  return msg;
}

Msg NewCmdMsg(Bytes data) {
  Msg msg = NewMsg(std::move(data));
  msg.type = MsgType::Command;
  return msg;
}

Msg ErrMsg(Error err) {
  Msg msg;
  msg.err = err;
  return msg;
}

} // namespace msgmux
