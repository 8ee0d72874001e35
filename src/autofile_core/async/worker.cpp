#include "autofile_core/async/worker.hpp"

#include <stdexcept>

#include "autofile_core/async/ITask.hpp"
#include "autofile_core/async/service_provider.hpp"
#include "autofile_core/async/task_queue.hpp"
#include "autofile_core/logger.hpp"

namespace autofile_core {
namespace async {

constexpr std::chrono::milliseconds Worker::kPollInterval;

Worker::Worker(int worker_id, TaskQueue& queue, ServiceProvider& services)
    : worker_id_(worker_id), queue_(queue), services_(services) {}

Worker::~Worker() {
  stop();
  join();
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::run_loop() {
  Logger& log = services_.get_logger();
  log.info("Worker", "[" + std::to_string(worker_id_) + "] starting run loop.");

  while (!should_stop_.load()) {
    ITaskPtr task = queue_.wait_and_pop(kPollInterval);
    if (task) {
      execute(*task);
    } else if (queue_.is_closed()) {
      break;
    }
  }
  log.info("Worker", "[" + std::to_string(worker_id_) + "] run loop terminated.");
}

bool Worker::run_one_task() {
  ITaskPtr task = queue_.try_pop();
  if (!task) {
    return false;
  }
  execute(*task);
  return true;
}

void Worker::execute(ITask& task) {
  try {
    task.execute(services_);
  } catch (const std::exception& e) {
    services_.get_logger().error("Worker", "[" + std::to_string(worker_id_) +
                                               "] ERROR processing task " +
                                               std::to_string(task.get_id()) + " (" +
                                               task.get_type() + "): " + e.what());
  }
}

}  // namespace async
}  // namespace autofile_core
