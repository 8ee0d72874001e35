#pragma once

#include <memory>
#include <vector>

#include "autofile_core/async/worker.hpp"

namespace autofile_core::async {

/**
 * @class WorkerPool
 * @brief Owns a fixed set of Worker threads draining one TaskQueue.
 *
 * Follows RAII: the destructor stops and joins every worker.
 */
class WorkerPool {
 public:
  /**
   * @param num_threads Number of worker threads; must be at least one.
   * @param queue Shared queue the workers pop from.
   * @param services Dependencies handed to every task.
   */
  WorkerPool(size_t num_threads, TaskQueue& queue, ServiceProvider& services);

  ~WorkerPool();

  void start();

  // Signals every worker, then waits for each to finish its current task.
  void stop();

  bool is_running() const {
    return is_running_;
  }
  size_t size() const {
    return workers_.size();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::vector<std::unique_ptr<Worker>> workers_;
  ServiceProvider& services_;
  bool is_running_ = false;
};

}  // namespace autofile_core::async
