#include "autofile_core/async/task_queue.hpp"

namespace autofile_core {
namespace async {

bool TaskQueue::push(ITaskPtr task) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) {
      return false;
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

ITaskPtr TaskQueue::wait_and_pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_for(lk, timeout, [this] { return closed_ || !tasks_.empty(); });
  if (tasks_.empty()) {
    return nullptr;
  }
  ITaskPtr task = std::move(tasks_.front());
  tasks_.pop_front();
  return task;
}

ITaskPtr TaskQueue::try_pop() {
  std::lock_guard<std::mutex> lk(mu_);
  if (tasks_.empty()) {
    return nullptr;
  }
  ITaskPtr task = std::move(tasks_.front());
  tasks_.pop_front();
  return task;
}

std::size_t TaskQueue::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  const std::size_t dropped = tasks_.size();
  tasks_.clear();
  return dropped;
}

void TaskQueue::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool TaskQueue::is_closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::size_t TaskQueue::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tasks_.size();
}

}  // namespace async
}  // namespace autofile_core
