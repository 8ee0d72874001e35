#include "autofile_core/async/event_debouncer.hpp"

#include <algorithm>
#include <cctype>

#include "autofile_core/async/service_provider.hpp"
#include "autofile_core/async/settle_check_task.hpp"
#include "autofile_core/async/timer_scheduler.hpp"
#include "autofile_core/logger.hpp"
#include "autofile_core/processed_set.hpp"

namespace autofile_core {
namespace async {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

const char* to_string(EventKind kind) {
  switch (kind) {
    case EventKind::Created: return "created";
    case EventKind::Modified: return "modified";
    case EventKind::Moved: return "moved";
    case EventKind::Deleted: return "deleted";
    case EventKind::Overflow: return "overflow";
  }
  return "unknown";
}

EventDebouncer::EventDebouncer(DebounceConfig cfg, TimerScheduler& scheduler,
                               ServiceProvider& services)
    : cfg_(std::move(cfg)), scheduler_(scheduler), services_(services) {
  for (const auto& suffix : cfg_.ignore_suffixes) {
    lowered_suffixes_.push_back(to_lower(suffix));
  }
}

bool EventDebouncer::should_ignore(const std::filesystem::path& path) const {
  const std::string name = path.filename().string();
  if (name.empty() || name[0] == '.') {
    return true;
  }
  const std::string lowered = to_lower(name);
  // Provenance sidecars move together with their file
  if (ends_with(lowered, ":zone.identifier")) {
    return true;
  }
  for (const auto& suffix : lowered_suffixes_) {
    if (ends_with(lowered, suffix)) {
      return true;
    }
  }
  return false;
}

std::optional<std::chrono::milliseconds> EventDebouncer::delay_for(EventKind kind) const {
  switch (kind) {
    case EventKind::Created: return cfg_.created_delay;
    case EventKind::Moved: return cfg_.moved_delay;
    case EventKind::Modified: return cfg_.modified_delay;
    case EventKind::Deleted:
    case EventKind::Overflow:
      break;
  }
  return std::nullopt;
}

bool EventDebouncer::on_event(const FileWatchEvent& ev) {
  WatcherCounters& counters = services_.get_counters();
  counters.events_seen++;

  const auto delay = delay_for(ev.kind);
  if (!delay || ev.is_dir || should_ignore(ev.path)) {
    counters.events_ignored++;
    return false;
  }

  std::error_code ec;
  if (std::filesystem::is_directory(ev.path, ec)) {
    counters.events_ignored++;
    return false;
  }

  if (services_.get_processed_set().contains(ev.path)) {
    counters.events_ignored++;
    return false;
  }

  auto task = std::make_unique<SettleCheckTask>(next_task_id_++, ev.path, ev.kind);
  if (!scheduler_.schedule(std::move(task), *delay)) {
    services_.get_logger().error("Debouncer",
                                 "Scheduler stopped, dropping check for " + ev.path.string());
    return false;
  }
  counters.checks_scheduled++;
  return true;
}

WatcherStats EventDebouncer::stats() const {
  return services_.get_counters().snapshot();
}

}  // namespace async
}  // namespace autofile_core
