#include "autofile_core/async/worker_pool.hpp"

#include <stdexcept>

#include "autofile_core/async/service_provider.hpp"
#include "autofile_core/logger.hpp"

namespace autofile_core::async {

WorkerPool::WorkerPool(size_t num_threads, TaskQueue& queue, ServiceProvider& services)
    : services_(services) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(std::make_unique<Worker>(static_cast<int>(i), queue, services));
  }
  services_.get_logger().info("WorkerPool",
                              "Created with " + std::to_string(num_threads) + " workers.");
}

WorkerPool::~WorkerPool() {
  stop();
}

void WorkerPool::start() {
  if (is_running_) {
    services_.get_logger().error("WorkerPool", "Warning: already running.");
    return;
  }
  for (const auto& worker : workers_) {
    worker->start();
  }
  is_running_ = true;
}

void WorkerPool::stop() {
  if (!is_running_) {
    return;
  }
  services_.get_logger().info("WorkerPool", "Stopping all workers...");
  for (const auto& worker : workers_) {
    worker->stop();
  }
  for (const auto& worker : workers_) {
    worker->join();
  }
  is_running_ = false;
}

}  // namespace autofile_core::async
