#pragma once

#include <filesystem>
#include <functional>
#include <mutex>

#include "autofile_core/async/watcher_stats.hpp"

namespace autofile_core {
class SettleDetector;
class ProcessedSet;
class Logger;
}

namespace autofile_core {

// Everything a background task may touch. Built once by the owner of the
// pipeline and handed to the workers by reference.
class ServiceProvider {
 public:
  using ArrivalHandler = std::function<void(const std::filesystem::path&)>;

  ServiceProvider(SettleDetector& settle, ProcessedSet& processed, Logger& logger)
      : settle_(settle), processed_(processed), logger_(logger) {}

  SettleDetector& get_settle_detector() {
    return settle_;
  }
  ProcessedSet& get_processed_set() {
    return processed_;
  }
  Logger& get_logger() {
    return logger_;
  }
  async::WatcherCounters& get_counters() {
    return counters_;
  }

  void set_arrival_handler(ArrivalHandler handler) {
    std::lock_guard<std::mutex> lk(handler_mu_);
    arrival_handler_ = std::move(handler);
  }

  // Calls the arrival handler, if one is set, on the calling thread.
  bool dispatch_arrival(const std::filesystem::path& path) {
    ArrivalHandler handler;
    {
      std::lock_guard<std::mutex> lk(handler_mu_);
      handler = arrival_handler_;
    }
    if (!handler) {
      return false;
    }
    handler(path);
    return true;
  }

 private:
  SettleDetector& settle_;
  ProcessedSet& processed_;
  Logger& logger_;
  async::WatcherCounters counters_;

  std::mutex handler_mu_;
  ArrivalHandler arrival_handler_;
};

}  // namespace autofile_core
