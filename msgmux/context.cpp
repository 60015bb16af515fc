#include "msgmux/context.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace msgmux {

namespace detail {

struct ContextState {
  explicit ContextState(bool cancellable) : cancellable(cancellable) {}

  // Cancel with the given cause. Only the first call has an effect.
  void Cancel(Error cause) {
    CancelSubscription parent;
    {
      std::lock_guard<std::mutex> lock(mtx);
      if (done.load()) {
        return;
      }
      err = cause;
      done.store(true);
      parent = std::move(parent_sub);
    }
    cv.notify_all();

    // Callbacks run one at a time outside the lock so they may take their
    // own locks. Each stays in the map until it starts, so RemoveCallback
    // either drops it first or waits for it to finish.
    for (;;) {
      std::function<void()> fn;
      {
        std::lock_guard<std::mutex> lock(mtx);
        if (callbacks.empty()) {
          break;
        }
        auto it = callbacks.begin();
        running_id = it->first;
        running_thread = std::this_thread::get_id();
        fn = std::move(it->second);
        callbacks.erase(it);
      }
      fn();
      {
        std::lock_guard<std::mutex> lock(mtx);
        running_id = 0;
        running_thread = std::thread::id();
      }
      callback_done.notify_all();
    }
  }

  uint64_t AddCallback(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(mtx);
    if (done.load()) {
      return 0;
    }
    uint64_t id = next_id++;
    callbacks.emplace(id, std::move(fn));
    return id;
  }

  // Unregister a callback. Blocks while it is running on another thread,
  // so its captures stay valid until it returns.
  void RemoveCallback(uint64_t id) {
    std::unique_lock<std::mutex> lock(mtx);
    callbacks.erase(id);
    if (running_thread == std::this_thread::get_id()) {
      return;
    }
    callback_done.wait(lock, [this, id]() { return running_id != id; });
  }

  const bool cancellable;
  std::optional<Context::Clock::time_point> deadline;

  std::mutex mtx;
  std::condition_variable cv;
  std::atomic<bool> done{false};
  Error err = Error::OK;
  uint64_t next_id = 1;
  std::map<uint64_t, std::function<void()>> callbacks;

  // Callback currently run by Cancel, 0 if none
  uint64_t running_id = 0;
  std::thread::id running_thread;
  std::condition_variable callback_done;

  // Link to the parent, dropped once this context is cancelled.
  // Guarded by mtx.
  CancelSubscription parent_sub;
};

}  // namespace detail

CancelSubscription::CancelSubscription(
    std::shared_ptr<detail::ContextState> state, uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancelSubscription::~CancelSubscription() { Reset(); }

CancelSubscription::CancelSubscription(CancelSubscription&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
  other.id_ = 0;
}

CancelSubscription& CancelSubscription::operator=(
    CancelSubscription&& other) noexcept {
  if (this != &other) {
    Reset();
    state_ = std::move(other.state_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void CancelSubscription::Reset() {
  if (state_ && id_ != 0) {
    state_->RemoveCallback(id_);
  }
  state_.reset();
  id_ = 0;
}

Context::Context() : Context(Background()) {}

Context::Context(std::shared_ptr<detail::ContextState> state)
    : state_(std::move(state)) {}

Context Context::Background() {
  static const auto background =
      std::make_shared<detail::ContextState>(false);
  return Context(background);
}

std::pair<Context, CancelFunc> Context::WithCancel(const Context& parent) {
  auto state = std::make_shared<detail::ContextState>(true);
  state->deadline = parent.state_->deadline;

  if (parent.state_->cancellable) {
    if (parent.Done()) {
      state->Cancel(parent.Err());
    } else {
      // The callback only runs from the parent's own Cancel, so the raw
      // parent pointer is valid there. The parent must not keep its
      // children alive.
      std::weak_ptr<detail::ContextState> weak = state;
      detail::ContextState* parent_raw = parent.state_.get();
      uint64_t id = parent.state_->AddCallback([weak, parent_raw]() {
        if (auto child = weak.lock()) {
          child->Cancel(parent_raw->err);
        }
      });
      if (id == 0) {
        // Parent was cancelled between the check and the registration
        state->Cancel(parent.Err());
      } else {
        CancelSubscription sub(parent.state_, id);
        std::lock_guard<std::mutex> lock(state->mtx);
        if (!state->done.load()) {
          state->parent_sub = std::move(sub);
        }
      }
    }
  }

  CancelFunc cancel = [state]() { state->Cancel(Error::Canceled); };
  return {Context(state), cancel};
}

std::pair<Context, CancelFunc> Context::WithTimeout(const Context& parent,
                                                    Clock::duration timeout) {
  auto [ctx, cancel] = WithCancel(parent);
  auto state = ctx.state_;
  auto deadline = Clock::now() + timeout;
  if (!state->deadline || deadline < *state->deadline) {
    state->deadline = deadline;
  }

  // The timer holds the state until the deadline or an earlier cancel
  std::thread([state, deadline]() {
    std::unique_lock<std::mutex> lock(state->mtx);
    bool cancelled = state->cv.wait_until(
        lock, deadline, [&state]() { return state->done.load(); });
    lock.unlock();
    if (!cancelled) {
      state->Cancel(Error::DeadlineExceeded);
    }
  }).detach();

  return {ctx, cancel};
}

bool Context::Done() const { return state_->done.load(); }

Error Context::Err() const {
  if (!state_->done.load()) {
    return Error::OK;
  }
  std::lock_guard<std::mutex> lock(state_->mtx);
  return state_->err;
}

std::optional<Context::Clock::time_point> Context::Deadline() const {
  return state_->deadline;
}

CancelSubscription Context::OnCancel(std::function<void()> fn) const {
  if (!state_->cancellable) {
    return {};
  }
  uint64_t id = state_->AddCallback(std::move(fn));
  if (id == 0) {
    return {};
  }
  return CancelSubscription(state_, id);
}

bool Context::WaitFor(Clock::duration d) const {
  std::unique_lock<std::mutex> lock(state_->mtx);
  return state_->cv.wait_for(lock, d,
                             [this]() { return state_->done.load(); });
}

}  // namespace msgmux
