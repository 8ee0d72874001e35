#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "autofile_core/types/pipeline_result.hpp"

namespace autofile_core {
namespace async {

// Many producers (workers), one consumer (the daemon main thread). Workers
// never call back into the consumer directly; they post here.
class ResultQueue {
 public:
  ResultQueue() = default;

  ResultQueue(const ResultQueue&) = delete;
  ResultQueue& operator=(const ResultQueue&) = delete;

  void post(PipelineResult result) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      results_.push_back(std::move(result));
    }
    cv_.notify_one();
  }

  // Waits up to timeout for at least one result, then takes everything queued.
  std::vector<PipelineResult> drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return !results_.empty(); });
    std::vector<PipelineResult> out;
    out.reserve(results_.size());
    while (!results_.empty()) {
      out.push_back(std::move(results_.front()));
      results_.pop_front();
    }
    return out;
  }

  std::optional<PipelineResult> try_pop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (results_.empty()) {
      return std::nullopt;
    }
    PipelineResult r = std::move(results_.front());
    results_.pop_front();
    return r;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return results_.size();
  }

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<PipelineResult> results_;
};

}  // namespace async
}  // namespace autofile_core
