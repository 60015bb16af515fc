#ifndef MSGMUX_TASK_GROUP_HPP
#define MSGMUX_TASK_GROUP_HPP

#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "msgmux/errors.hpp"

namespace msgmux {

// Runs tasks on their own threads and joins them as a group.
// Wait() returns the first error reported by any task.
class TaskGroup {
 public:
  TaskGroup() = default;
  ~TaskGroup();

  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;

  // Start a task
  void Go(std::function<Error()> fn);

  // Join all started tasks; returns the first non-OK error
  Error Wait();

 private:
  std::mutex mtx_;
  Error first_error_ = Error::OK;
  std::vector<std::thread> threads_;
};

}  // namespace msgmux

#endif  // MSGMUX_TASK_GROUP_HPP
