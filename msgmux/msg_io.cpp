#include "msgmux/msg_io.hpp"

#include <fmt/format.h>

namespace msgmux {

namespace {

AdapterID NextAdapterID() {
  static std::atomic<AdapterID> next{1};
  return next.fetch_add(1);
}

} // namespace

MsgReader::MsgReader(std::unique_ptr<Connection> conn)
    : conn_(std::move(conn)), id_(NextAdapterID()) {}

MsgReader::~MsgReader() { Close(); }

Error MsgReader::Read(const Context &ctx, Msg *msg) {
  if (closed_.load() || !conn_) {
    *msg = ErrMsg(Error::ConnectionClosed);
    return msg->err;
  }
  if (ctx.Done()) {
    *msg = ErrMsg(ctx.Err());
    return msg->err;
  }

  *msg = conn_->Read(ctx);
  return msg->err;
}

Error MsgReader::Close() {
  if (closed_.exchange(true) || !conn_) {
    return Error::OK;
  }
  return conn_->Close();
}

std::string MsgReader::Name() const {
  return fmt::format("reader#{}({})", id_, conn_ ? conn_->Name() : "nil");
}

MsgWriter::MsgWriter(std::unique_ptr<Connection> conn)
    : conn_(std::move(conn)), id_(NextAdapterID()) {}

MsgWriter::~MsgWriter() { Close(); }

Error MsgWriter::Write(const Context &ctx, const Msg &msg) {
  if (closed_.load() || !conn_) {
    return Error::ConnectionClosed;
  }
  if (ctx.Done()) {
    return ctx.Err();
  }
  return conn_->Write(ctx, msg);
}

Error MsgWriter::Close() {
  if (closed_.exchange(true) || !conn_) {
    return Error::OK;
  }
  return conn_->Close();
}

std::string MsgWriter::Name() const {
  return fmt::format("writer#{}({})", id_, conn_ ? conn_->Name() : "nil");
}

} // namespace msgmux
