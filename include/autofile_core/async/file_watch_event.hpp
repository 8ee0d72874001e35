#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>

namespace autofile_core {
namespace async {

// High-level event kind we care about (abstracted from inotify details)
enum class EventKind {
  Created,   // file created in the watch folder
  Modified,  // content write finished (close after write)
  Moved,     // renamed or moved into the watch folder; path is the destination
  Deleted,   // removed or moved out
  Overflow   // backend dropped events, caller should rescan
};

const char* to_string(EventKind kind);

struct FileWatchEvent {
  std::filesystem::path path;
  std::optional<std::filesystem::path> old_path;  // for Moved, when known
  bool is_dir = false;
  EventKind kind = EventKind::Modified;
  std::chrono::system_clock::time_point ts{};
};

// Minimal interface for platform backends. The handler is called from the
// backend's own thread.
class IFileWatcherBackend {
 public:
  using Handler = std::function<void(const FileWatchEvent&)>;

  virtual ~IFileWatcherBackend() = default;
  virtual void start() = 0;
  virtual void stop() = 0;
};

}  // namespace async
}  // namespace autofile_core
