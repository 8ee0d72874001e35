#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "autofile_core/async/ITask.hpp"

namespace autofile_core {
namespace async {

/**
 * @class TaskQueue
 * @brief FIFO of ready-to-run tasks shared by the worker pool.
 *
 * Producers push tasks that are due now (the TimerScheduler for deferred
 * work); workers block in wait_and_pop(). After close() pushes are refused and
 * waiting workers wake up with nullptr.
 */
class TaskQueue {
 public:
  TaskQueue() = default;

  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  // Returns false (and drops the task) once the queue is closed.
  bool push(ITaskPtr task);

  // nullptr on timeout or when the queue is closed and empty.
  ITaskPtr wait_and_pop(std::chrono::milliseconds timeout);
  ITaskPtr try_pop();

  // Drops every queued task. Returns how many were dropped.
  std::size_t clear();

  void close();
  bool is_closed() const;
  std::size_t size() const;

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<ITaskPtr> tasks_;
  bool closed_ = false;
};

}  // namespace async
}  // namespace autofile_core
