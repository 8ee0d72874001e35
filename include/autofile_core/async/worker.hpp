#pragma once

#include <atomic>
#include <chrono>
#include <thread>

namespace autofile_core {
class ITask;
class ServiceProvider;
}

namespace autofile_core {
namespace async {

class TaskQueue;

/**
 * @class Worker
 * @brief A single background thread that runs tasks from the TaskQueue.
 *
 * A Worker blocks on the queue, executes each task it pops against the shared
 * ServiceProvider and logs (never rethrows) task failures. It is non-copyable
 * and non-movable to keep ownership of the thread obvious; the destructor stops
 * and joins.
 */
class Worker {
 public:
  Worker(int worker_id, TaskQueue& queue, ServiceProvider& services);

  ~Worker();

  /**
   * @brief Starts the run loop in a new thread.
   * @throws std::runtime_error if the worker is already running.
   */
  void start();

  // Signals the loop to exit after its current task. Does not block.
  void stop();

  // Waits for the thread to finish. Call stop() first.
  void join();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

  // Synchronously runs one queued task, if any. Used by tests.
  bool run_one_task();

 private:
  void run_loop();
  void execute(ITask& task);

  int worker_id_;
  TaskQueue& queue_;
  ServiceProvider& services_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;

  static constexpr std::chrono::milliseconds kPollInterval{200};
};

}  // namespace async
}  // namespace autofile_core
