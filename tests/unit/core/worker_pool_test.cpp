#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>

#include "autofile_core/async/ITask.hpp"
#include "autofile_core/async/service_provider.hpp"
#include "autofile_core/async/task_queue.hpp"
#include "autofile_core/async/worker_pool.hpp"
#include "autofile_core/processed_set.hpp"
#include "autofile_core/settle_detector.hpp"
#include "utilities_test.hpp"

namespace autofile_tests {

using namespace autofile_core;
using namespace autofile_core::async;

namespace {

class CountingTask : public ITask {
 public:
  CountingTask(long long id, std::atomic<int>& counter, bool fail = false)
      : ITask(id), counter_(counter), fail_(fail) {}

  void execute(ServiceProvider&) override {
    if (fail_) {
      throw std::runtime_error("task failure");
    }
    counter_++;
  }
  const char* get_type() const override {
    return "COUNTING";
  }

 private:
  std::atomic<int>& counter_;
  bool fail_;
};

bool wait_for(const std::function<bool()>& predicate,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

}  // namespace

class WorkerPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    logger_.set_console_enabled(false);
  }

  Logger logger_;
  SettleDetector settle_;
  ProcessedSet processed_;
  ServiceProvider services_{settle_, processed_, logger_};
  TaskQueue queue_;
};

TEST_F(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0, queue_, services_); }, std::invalid_argument);
}

TEST_F(WorkerPoolTest, StopWithoutStartIsNoOp) {
  EXPECT_NO_THROW({
    WorkerPool pool(1, queue_, services_);
    pool.stop();
  });
}

TEST_F(WorkerPoolTest, StartTwiceShowsWarningAndNoThrow) {
  EXPECT_NO_THROW({
    WorkerPool pool(2, queue_, services_);
    pool.start();
    pool.start();
    EXPECT_TRUE(pool.is_running());
    EXPECT_EQ(pool.size(), 2u);
    pool.stop();
  });
}

TEST_F(WorkerPoolTest, RunsQueuedTasks) {
  std::atomic<int> counter{0};
  WorkerPool pool(3, queue_, services_);
  pool.start();

  for (int i = 0; i < 20; ++i) {
    queue_.push(std::make_unique<CountingTask>(i, counter));
  }

  EXPECT_TRUE(wait_for([&] { return counter.load() == 20; }));
  pool.stop();
}

TEST_F(WorkerPoolTest, FailingTaskDoesNotStopWorker) {
  std::atomic<int> counter{0};
  WorkerPool pool(1, queue_, services_);
  pool.start();

  queue_.push(std::make_unique<CountingTask>(1, counter, /*fail*/ true));
  queue_.push(std::make_unique<CountingTask>(2, counter));

  EXPECT_TRUE(wait_for([&] { return counter.load() == 1; }));
  pool.stop();
}

TEST_F(WorkerPoolTest, ServiceProviderWithoutHandlerDispatchesNothing) {
  EXPECT_FALSE(services_.dispatch_arrival("/downloads/a.pdf"));

  std::atomic<int> calls{0};
  services_.set_arrival_handler([&](const std::filesystem::path&) { calls++; });
  EXPECT_TRUE(services_.dispatch_arrival("/downloads/a.pdf"));
  EXPECT_EQ(calls.load(), 1);
}

}  // namespace autofile_tests
