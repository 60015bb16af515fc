#include "msgmux/broadcast_writer.hpp"

#include <algorithm>

#include "msgmux/log.hpp"
#include "msgmux/task_group.hpp"

namespace msgmux {

BroadcastWriter::BroadcastWriter(const Context& ctx,
                                 const PoolConfig& /*config*/)
    : ctx_(ctx) {}

BroadcastWriter::~BroadcastWriter() { Close(); }

Error BroadcastWriter::AddConn(std::shared_ptr<MsgWriter> w) {
  if (!w) {
    return Error::InvalidArgument;
  }

  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!closed_) {
      gate_.Enable();
      writers_.push_back(w);
      MSGMUX_LOG_DEBUG("broadcast pool: added {} ({} active)", w->Name(),
                       writers_.size());
      return Error::OK;
    }
  }

  Error err = w->Close();
  if (err != Error::OK) {
    MSGMUX_LOG_DEBUG("broadcast pool: closing {}: {}", w->Name(),
                     ErrorString(err));
  }
  return Error::PoolClosed;
}

void BroadcastWriter::RmConn(const std::shared_ptr<MsgWriter>& w) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = std::find(writers_.begin(), writers_.end(), w);
  if (it != writers_.end()) {
    writers_.erase(it);
  }
}

Error BroadcastWriter::Write(const Context& ctx, const Msg& msg) {
  Error err = gate_.Wait(ctx);
  if (err != Error::OK) {
    return err;
  }

  std::vector<std::shared_ptr<MsgWriter>> failed;
  {
    // Held for the whole broadcast so the set of destinations is stable
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      return Error::PoolClosed;
    }
    if (ctx_.Done()) {
      return ctx_.Err();
    }

    std::vector<Error> results(writers_.size(), Error::OK);
    TaskGroup grp;
    for (size_t i = 0; i < writers_.size(); ++i) {
      auto w = writers_[i];
      grp.Go([&ctx, &msg, &results, w, i]() {
        results[i] = w->Write(ctx, msg);
        return results[i];
      });
    }
    err = grp.Wait();

    for (size_t i = 0; i < results.size(); ++i) {
      if (results[i] != Error::OK && !IsCancellation(results[i])) {
        MSGMUX_LOG_WARN("broadcast pool: write to {} failed: {}",
                        writers_[i]->Name(), ErrorString(results[i]));
        failed.push_back(writers_[i]);
      }
    }
    for (const auto& w : failed) {
      writers_.erase(std::find(writers_.begin(), writers_.end(), w));
    }
  }

  for (const auto& w : failed) {
    Error close_err = w->Close();
    if (close_err != Error::OK) {
      MSGMUX_LOG_DEBUG("broadcast pool: closing {}: {}", w->Name(),
                       ErrorString(close_err));
    }
  }

  return err;
}

Error BroadcastWriter::Close() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (closed_) {
    return Error::OK;  // Already closed
  }
  closed_ = true;
  gate_.Abort();

  Error err = Error::OK;
  for (const auto& w : writers_) {
    Error e = w->Close();
    if (e != Error::OK && err == Error::OK) {
      err = e;
    }
  }
  MSGMUX_LOG_DEBUG("broadcast pool: closed {} connections ({})",
                   writers_.size(), ErrorString(err));
  writers_.clear();
  return err;
}

size_t BroadcastWriter::NumConns() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return writers_.size();
}

}  // namespace msgmux
