#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

#include "autofile_core/async/ITask.hpp"

namespace autofile_core {
namespace async {

class TaskQueue;

/**
 * @class TimerScheduler
 * @brief Holds deferred tasks until they are due, then hands them to the
 * TaskQueue.
 *
 * One dispatcher thread sleeps until the earliest deadline. Tasks due at the
 * same instant are released in scheduling order. stop() abandons everything
 * still pending.
 */
class TimerScheduler {
 public:
  using Clock = std::chrono::steady_clock;

  explicit TimerScheduler(TaskQueue& queue);
  ~TimerScheduler();

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;

  void start();

  // Joins the dispatcher and drops pending tasks. Returns how many were dropped.
  std::size_t stop();

  // Returns false if the scheduler is stopped (the task is dropped).
  bool schedule(ITaskPtr task, std::chrono::milliseconds delay);

  std::size_t pending() const;
  bool is_running() const {
    return running_.load();
  }

 private:
  void dispatch_loop();

  TaskQueue& queue_;
  std::atomic<bool> running_{false};
  std::thread thread_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::multimap<Clock::time_point, ITaskPtr> timers_;
};

}  // namespace async
}  // namespace autofile_core
