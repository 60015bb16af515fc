#include "msgmux/task_group.hpp"

namespace msgmux {

TaskGroup::~TaskGroup() { Wait(); }

void TaskGroup::Go(std::function<Error()> fn) {
  threads_.emplace_back([this, fn = std::move(fn)]() {
    Error err = fn();
    if (err != Error::OK) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (first_error_ == Error::OK) {
        first_error_ = err;
      }
    }
  });
}

Error TaskGroup::Wait() {
  for (auto& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  threads_.clear();

  std::lock_guard<std::mutex> lock(mtx_);
  return first_error_;
}

}  // namespace msgmux
