#include "msgmux/lb_writer.hpp"

#include <chrono>
#include <tuple>

#include "msgmux/log.hpp"

namespace msgmux {

LoadBalancedWriter::LoadBalancedWriter(const Context& ctx,
                                       const PoolConfig& config)
    : config_(config), queue_(config.queue_size) {
  std::tie(ctx_, cancel_) = Context::WithCancel(ctx);
}

LoadBalancedWriter::~LoadBalancedWriter() { Close(); }

Error LoadBalancedWriter::AddConn(std::shared_ptr<MsgWriter> w) {
  if (!w) {
    return Error::InvalidArgument;
  }

  Reap();

  auto worker = std::make_shared<Worker>();
  worker->writer = w;
  std::tie(worker->ctx, worker->cancel) = Context::WithCancel(ctx_);

  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!closed_) {
      gate_.Enable();
      workers_[w->Id()] = worker;
      live_workers_.fetch_add(1);
      threads_.emplace(worker.get(), std::thread([this, worker]() mutable {
                         Listen(std::move(worker));
                       }));
      MSGMUX_LOG_DEBUG("lb pool: added {} ({} active)", w->Name(),
                       workers_.size());
      return Error::OK;
    }
  }

  worker->cancel();
  Error err = w->Close();
  if (err != Error::OK) {
    MSGMUX_LOG_DEBUG("lb pool: closing {}: {}", w->Name(), ErrorString(err));
  }
  return Error::PoolClosed;
}

void LoadBalancedWriter::RmConn(const std::shared_ptr<MsgWriter>& w) {
  if (!w) {
    return;
  }

  std::shared_ptr<Worker> worker;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = workers_.find(w->Id());
    if (it == workers_.end()) {
      return;
    }
    worker = it->second;
    workers_.erase(it);
  }

  MSGMUX_LOG_DEBUG("lb pool: removing {}", w->Name());
  worker->cancel();
}

Error LoadBalancedWriter::Write(const Context& ctx, const Msg& msg) {
  Error err = gate_.Wait(ctx);
  if (err != Error::OK) {
    return err;
  }
  if (ctx_.Done()) {
    return queue_.IsClosed() ? Error::PoolClosed : ctx_.Err();
  }

  err = queue_.Push(ctx, Envelope{msg, 0});
  return err == Error::QueueClosed ? Error::PoolClosed : err;
}

Error LoadBalancedWriter::Close() {
  std::vector<std::shared_ptr<Worker>> workers;
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      return Error::OK;  // Already closed
    }
    closed_ = true;
    for (auto& entry : workers_) {
      workers.push_back(entry.second);
    }
    workers_.clear();
    for (auto& entry : threads_) {
      threads.push_back(std::move(entry.second));
    }
    threads_.clear();
    for (auto& t : finished_) {
      threads.push_back(std::move(t));
    }
    finished_.clear();
  }

  queue_.Close();
  gate_.Abort();
  cancel_();

  // Unblock writes still in flight
  Error err = Error::OK;
  for (const auto& worker : workers) {
    Error e = worker->writer->Close();
    if (e != Error::OK && err == Error::OK) {
      err = e;
    }
  }

  for (auto& t : threads) {
    if (t.joinable()) {
      t.join();
    }
  }

  auto left = queue_.Drain();
  if (!left.empty()) {
    dropped_.fetch_add(left.size());
    MSGMUX_LOG_DEBUG("lb pool: discarded {} queued messages on close",
                     left.size());
  }

  MSGMUX_LOG_DEBUG("lb pool: closed {} connections ({})", workers.size(),
                   ErrorString(err));
  return err;
}

size_t LoadBalancedWriter::NumConns() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return workers_.size();
}

LoadBalancedWriter::Stats LoadBalancedWriter::GetStats() const {
  Stats stats;
  stats.delivered = delivered_.load();
  stats.failed_attempts = failed_attempts_.load();
  stats.dropped = dropped_.load();
  stats.evicted = evicted_.load();
  return stats;
}

void LoadBalancedWriter::Listen(std::shared_ptr<Worker> worker) {
  const Context& ctx = worker->ctx;
  const auto& w = worker->writer;
  Error cause = Error::OK;

  for (;;) {
    auto next = queue_.Pop(ctx);
    if (!next.ok()) {
      cause = next.error;
      break;
    }

    Envelope env = std::move(next.value);
    Error err = w->Write(ctx, env.msg);
    if (err == Error::OK) {
      delivered_.fetch_add(1);
      worker->consecutive_failures = 0;
      continue;
    }

    if (IsCancellation(err)) {
      // Never attempted; give it back untouched
      Retry(std::move(env));
      cause = err;
      break;
    }

    ++env.attempts;
    ++worker->consecutive_failures;
    failed_attempts_.fetch_add(1);
    MSGMUX_LOG_DEBUG("lb pool: write to {} failed ({}), attempt {}",
                     w->Name(), ErrorString(err), env.attempts);

    // Try another writer
    Retry(std::move(env));

    if (ctx.Done()) {
      cause = ctx.Err();
      break;
    }

    if (config_.evict_after_failures > 0 &&
        worker->consecutive_failures >= config_.evict_after_failures) {
      if (Unregister(worker)) {
        evicted_.fetch_add(1);
        MSGMUX_LOG_WARN("lb pool: evicting {} after {} consecutive failures",
                        w->Name(), worker->consecutive_failures);
      }
      cause = err;
      break;
    }

    if (config_.retry_backoff_ms > 0 &&
        ctx.WaitFor(std::chrono::milliseconds(config_.retry_backoff_ms))) {
      cause = ctx.Err();
      break;
    }
  }

  MSGMUX_LOG_DEBUG("lb pool: worker for {} exiting: {}", w->Name(),
                   ErrorString(cause));

  Error close_err = w->Close();
  if (close_err != Error::OK) {
    MSGMUX_LOG_DEBUG("lb pool: closing {}: {}", w->Name(),
                     ErrorString(close_err));
  }
  Unregister(worker);

  // Hand our own thread over to be joined and drop the writer, so the
  // connection is destroyed unless the caller still holds it
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = threads_.find(worker.get());
    if (it != threads_.end()) {
      finished_.push_back(std::move(it->second));
      threads_.erase(it);
    }
  }
  worker.reset();
  live_workers_.fetch_sub(1);
}

void LoadBalancedWriter::Reap() {
  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    finished.swap(finished_);
  }
  for (auto& t : finished) {
    t.join();
  }
}

void LoadBalancedWriter::Retry(Envelope env) {
  if (config_.max_retries > 0 && env.attempts > config_.max_retries) {
    dropped_.fetch_add(1);
    MSGMUX_LOG_WARN("lb pool: dropping {} after {} attempts: {}",
                    env.msg.String(), env.attempts,
                    ErrorString(Error::RetriesExhausted));
    return;
  }

  Error err = queue_.Requeue(std::move(env));
  if (err != Error::OK) {
    dropped_.fetch_add(1);
    MSGMUX_LOG_DEBUG("lb pool: could not requeue message: {}",
                     ErrorString(err));
  }
}

bool LoadBalancedWriter::Unregister(const std::shared_ptr<Worker>& worker) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = workers_.find(worker->writer->Id());
  if (it == workers_.end() || it->second != worker) {
    return false;
  }
  workers_.erase(it);
  return true;
}

}  // namespace msgmux
