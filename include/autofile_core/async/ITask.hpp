#pragma once

#include <chrono>
#include <memory>

namespace autofile_core {
class ServiceProvider;
}

namespace autofile_core {

// Unit of background work run by a Worker. Tasks live only in memory; a task
// that was scheduled but never executed is simply dropped at shutdown.
class ITask {
 public:
  explicit ITask(long long id)
      : id_(id), created_at_(std::chrono::steady_clock::now()) {}

  virtual ~ITask() = default;

  virtual void execute(ServiceProvider& services) = 0;

  virtual const char* get_type() const = 0;

  long long get_id() const {
    return id_;
  }
  std::chrono::steady_clock::time_point get_created_at() const {
    return created_at_;
  }

 protected:
  long long id_;
  std::chrono::steady_clock::time_point created_at_;
};

using ITaskPtr = std::unique_ptr<ITask>;
}  // namespace autofile_core
