#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>

#include "autofile_core/types/watched_file.hpp"

namespace autofile_core {

struct SettleConfig {
  // Gap between the two size reads of one probe, and between probes
  std::chrono::milliseconds probe_interval{500};
  int max_attempts = 10;
};

/**
 * @class SettleDetector
 * @brief Decides whether a file has finished being written.
 *
 * A probe reads the size, waits probe_interval and reads it again; the file is
 * ready when both reads succeed, agree, and are non-zero. Waits are
 * interruptible through cancel() so shutdown never blocks for the whole retry
 * budget.
 */
class SettleDetector {
 public:
  explicit SettleDetector(SettleConfig cfg = {});
  virtual ~SettleDetector() = default;

  SettleDetector(const SettleDetector&) = delete;
  SettleDetector& operator=(const SettleDetector&) = delete;

  // Single probe. Returns false immediately if the path cannot be stat'ed.
  virtual bool is_ready(const std::filesystem::path& path);

  // Bounded retry loop. Moves the file Settling -> Ready, or -> Rejected when the
  // path vanishes, the attempts run out, or cancel() was called.
  virtual bool wait_until_ready(WatchedFile& file);

  void cancel();
  bool is_cancelled() const {
    return cancelled_.load();
  }

  const SettleConfig& config() const {
    return cfg_;
  }

 private:
  bool probe(const std::filesystem::path& path, WatchedFile* record);
  // Returns false when woken by cancel()
  bool sleep_interval();

  const SettleConfig cfg_;
  std::atomic<bool> cancelled_{false};
  std::mutex sleep_mu_;
  std::condition_variable sleep_cv_;
};

}  // namespace autofile_core
