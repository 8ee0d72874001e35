#pragma once

#include <filesystem>

#include "autofile_core/async/ITask.hpp"
#include "autofile_core/async/file_watch_event.hpp"
#include "autofile_core/types/watched_file.hpp"

namespace autofile_core {
namespace async {

// Deferred readiness check for one path: settle, claim, then hand the path to
// the arrival handler. At most one check per path ever reaches the handler.
class SettleCheckTask : public ITask {
 public:
  SettleCheckTask(long long id, std::filesystem::path path, EventKind trigger)
      : ITask(id), file_(path), path_(std::move(path)), trigger_(trigger) {}

  void execute(ServiceProvider& services) override;

  const char* get_type() const override {
    return "SETTLE_CHECK";
  }

  const std::filesystem::path& path() const {
    return path_;
  }
  EventKind trigger() const {
    return trigger_;
  }
  // Processed once handed to the arrival handler, Rejected if it never settled
  const WatchedFile& file() const {
    return file_;
  }

 private:
  WatchedFile file_;
  std::filesystem::path path_;
  EventKind trigger_;
};

}  // namespace async
}  // namespace autofile_core
