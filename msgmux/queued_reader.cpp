#include "msgmux/queued_reader.hpp"

#include <algorithm>
#include <tuple>

#include "msgmux/log.hpp"
#include "msgmux/task_group.hpp"

namespace msgmux {

QueuedReader::QueuedReader(const Context& ctx, const PoolConfig& config)
    : queue_(config.queue_size) {
  std::tie(ctx_, cancel_) = Context::WithCancel(ctx);
}

QueuedReader::~QueuedReader() { Close(); }

Error QueuedReader::AddConn(std::shared_ptr<MsgReader> r) {
  if (!r) {
    return Error::InvalidArgument;
  }

  Reap();

  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!closed_.load()) {
      readers_.push_back(r);
      live_workers_.fetch_add(1);
      workers_.push_back({r, std::thread([this, r]() mutable {
                            Listen(std::move(r));
                          })});
      gate_.Enable();
      MSGMUX_LOG_DEBUG("read pool: added {} ({} active)", r->Name(),
                       readers_.size());
      return Error::OK;
    }
  }

  MSGMUX_LOG_DEBUG("read pool: rejected {}, pool closed", r->Name());
  Error err = r->Close();
  if (err != Error::OK) {
    MSGMUX_LOG_DEBUG("read pool: closing {}: {}", r->Name(), ErrorString(err));
  }
  return Error::PoolClosed;
}

void QueuedReader::RmConn(const std::shared_ptr<MsgReader>& r) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = std::find(readers_.begin(), readers_.end(), r);
  if (it != readers_.end()) {
    readers_.erase(it);
  }
}

Error QueuedReader::Read(const Context& ctx, Msg* msg) {
  Error err = gate_.Wait(ctx);
  if (err != Error::OK) {
    return err;
  }

  auto result = queue_.Pop(ctx);
  if (!result.ok()) {
    return result.error == Error::QueueClosed ? Error::PoolClosed
                                              : result.error;
  }

  *msg = std::move(result.value);
  return msg->err;
}

Error QueuedReader::Close() {
  std::vector<std::shared_ptr<MsgReader>> readers;
  std::vector<Worker> workers;
  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_.exchange(true)) {
      return Error::OK;  // Already closed
    }
    readers.swap(readers_);
    workers.swap(workers_);
    finished.swap(finished_);
  }

  // Stop workers from enqueuing anything further
  cancel_();
  gate_.Abort();

  TaskGroup grp;
  for (const auto& r : readers) {
    grp.Go([r]() { return r->Close(); });
  }
  Error err = grp.Wait();

  // Readers removed with RmConn still belong to their running worker
  for (auto& w : workers) {
    Error close_err = w.reader->Close();
    if (close_err != Error::OK) {
      MSGMUX_LOG_DEBUG("read pool: closing {}: {}", w.reader->Name(),
                       ErrorString(close_err));
    }
  }

  queue_.Close();

  for (auto& w : workers) {
    if (w.thread.joinable()) {
      w.thread.join();
    }
  }
  for (auto& t : finished) {
    t.join();
  }

  MSGMUX_LOG_DEBUG("read pool: closed {} connections ({})", readers.size(),
                   ErrorString(err));
  return err;
}

size_t QueuedReader::NumConns() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return readers_.size();
}

void QueuedReader::Listen(std::shared_ptr<MsgReader> r) {
  Error cause = Error::OK;

  for (;;) {
    Msg msg;
    Error err = r->Read(ctx_, &msg);

    if (ctx_.Done()) {
      cause = ctx_.Err();
      break;
    }

    // A failed read is still delivered so a consumer observes it
    Error push_err = queue_.Push(ctx_, std::move(msg));
    if (push_err != Error::OK) {
      cause = push_err;
      break;
    }
    if (err != Error::OK) {
      cause = err;
      break;
    }
  }

  MSGMUX_LOG_DEBUG("read pool: worker for {} exiting: {}", r->Name(),
                   ErrorString(cause));

  Error close_err = r->Close();
  if (close_err != Error::OK) {
    MSGMUX_LOG_DEBUG("read pool: closing {}: {}", r->Name(),
                     ErrorString(close_err));
  }
  RmConn(r);

  // Hand our own thread over to be joined and drop the reader, so the
  // connection is destroyed unless the caller still holds it
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = std::find_if(workers_.begin(), workers_.end(),
                           [&r](const Worker& w) { return w.reader == r; });
    if (it != workers_.end()) {
      finished_.push_back(std::move(it->thread));
      workers_.erase(it);
    }
  }
  r.reset();
  live_workers_.fetch_sub(1);
}

void QueuedReader::Reap() {
  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    finished.swap(finished_);
  }
  for (auto& t : finished) {
    t.join();
  }
}

}  // namespace msgmux
