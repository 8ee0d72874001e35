#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "autofile_core/async/file_watch_event.hpp"
#include "autofile_core/async/watcher_stats.hpp"

namespace autofile_core {
class ServiceProvider;
}

namespace autofile_core {
namespace async {

class TimerScheduler;

struct DebounceConfig {
  std::chrono::milliseconds created_delay{2000};
  std::chrono::milliseconds moved_delay{1000};
  std::chrono::milliseconds modified_delay{3000};

  // Matched case-insensitively against the end of the file name
  std::vector<std::string> ignore_suffixes{".tmp", ".crdownload", ".partial", ".download"};
};

/**
 * @class EventDebouncer
 * @brief Filters raw watcher events and schedules deferred settle checks.
 *
 * Hidden files, in-progress download names and directories are dropped. Every
 * other Created, Moved or Modified event schedules one SettleCheckTask after
 * the per-kind delay. Several checks for the same path may run; the
 * ProcessedSet claim inside the task lets only the first one through.
 */
class EventDebouncer {
 public:
  EventDebouncer(DebounceConfig cfg, TimerScheduler& scheduler, ServiceProvider& services);

  EventDebouncer(const EventDebouncer&) = delete;
  EventDebouncer& operator=(const EventDebouncer&) = delete;

  // Returns true when a check was scheduled.
  bool on_event(const FileWatchEvent& ev);

  bool should_ignore(const std::filesystem::path& path) const;

  std::optional<std::chrono::milliseconds> delay_for(EventKind kind) const;

  WatcherStats stats() const;

  const DebounceConfig& config() const {
    return cfg_;
  }

 private:
  const DebounceConfig cfg_;
  std::vector<std::string> lowered_suffixes_;
  TimerScheduler& scheduler_;
  ServiceProvider& services_;
  std::atomic<long long> next_task_id_{1};
};

}  // namespace async
}  // namespace autofile_core
