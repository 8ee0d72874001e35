#include "autofile_core/async/timer_scheduler.hpp"

#include <vector>

#include "autofile_core/async/task_queue.hpp"

namespace autofile_core {
namespace async {

TimerScheduler::TimerScheduler(TaskQueue& queue) : queue_(queue) {}

TimerScheduler::~TimerScheduler() {
  stop();
}

void TimerScheduler::start() {
  if (running_.load()) return;
  running_.store(true);
  thread_ = std::thread([this] { this->dispatch_loop(); });
}

std::size_t TimerScheduler::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    running_.store(false);
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();

  std::lock_guard<std::mutex> lk(mu_);
  const std::size_t dropped = timers_.size();
  timers_.clear();
  return dropped;
}

bool TimerScheduler::schedule(ITaskPtr task, std::chrono::milliseconds delay) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_.load()) {
      return false;
    }
    timers_.emplace(Clock::now() + delay, std::move(task));
  }
  cv_.notify_all();
  return true;
}

std::size_t TimerScheduler::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return timers_.size();
}

void TimerScheduler::dispatch_loop() {
  std::unique_lock<std::mutex> lk(mu_);
  while (running_.load()) {
    if (timers_.empty()) {
      cv_.wait(lk, [this] { return !running_.load() || !timers_.empty(); });
      continue;
    }

    const auto next_due = timers_.begin()->first;
    if (Clock::now() < next_due) {
      cv_.wait_until(lk, next_due);
      continue;
    }

    std::vector<ITaskPtr> due;
    const auto now = Clock::now();
    while (!timers_.empty() && timers_.begin()->first <= now) {
      due.push_back(std::move(timers_.begin()->second));
      timers_.erase(timers_.begin());
    }

    lk.unlock();
    for (auto& task : due) {
      queue_.push(std::move(task));
    }
    lk.lock();
  }
}

}  // namespace async
}  // namespace autofile_core
