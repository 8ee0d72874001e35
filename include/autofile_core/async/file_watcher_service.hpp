#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>

#include "autofile_core/async/file_watch_event.hpp"
#include "autofile_core/async/watcher_stats.hpp"

namespace autofile_core {
class ServiceProvider;
}

namespace autofile_core {
namespace async {

class EventDebouncer;

// Watcher behavior/configuration knobs
struct WatchConfig {
  // Claim everything already in the folder at start so historic downloads stay put
  bool seed_existing_files = true;
};

// Creates the platform backend for a folder (inotify on Linux).
using BackendFactory = std::function<std::unique_ptr<IFileWatcherBackend>(
    const std::filesystem::path& root, IFileWatcherBackend::Handler handler)>;

std::unique_ptr<IFileWatcherBackend> make_inotify_backend(const std::filesystem::path& root,
                                                          IFileWatcherBackend::Handler handler);

/**
 * @class FileWatcherService
 * @brief Front end of the arrival pipeline.
 *
 * Owns the platform backend for the watched folder and routes its events into
 * the EventDebouncer. Overflow events trigger a rescan that replays every
 * unclaimed file as Created.
 */
class FileWatcherService {
 public:
  FileWatcherService(const WatchConfig& cfg,
                     EventDebouncer& debouncer,
                     ServiceProvider& services,
                     BackendFactory backend_factory = make_inotify_backend);
  virtual ~FileWatcherService();

  FileWatcherService(const FileWatcherService&) = delete;
  FileWatcherService& operator=(const FileWatcherService&) = delete;

  /**
   * @brief Starts watching folder, replacing any previous watch.
   * @throws std::runtime_error if folder is not a directory or the backend
   * cannot be started.
   */
  void start_watching(const std::filesystem::path& folder);

  // Stops the backend. Checks already scheduled still run. Safe to repeat.
  void stop_watching();

  bool is_running() const {
    return running_.load();
  }

  std::filesystem::path watched_folder() const;

  // Called once per claimed path, from a worker thread.
  void set_arrival_handler(std::function<void(const std::filesystem::path&)> handler);

  // Replays every unclaimed regular file in the folder as a Created event.
  std::size_t rescan();

  WatcherStats stats() const;

 protected:
  // Backend callback (exposed for testing)
  void on_backend_event(const FileWatchEvent& ev);

 private:
  const WatchConfig cfg_;
  EventDebouncer& debouncer_;
  ServiceProvider& services_;
  BackendFactory backend_factory_;

  mutable std::mutex mu_;
  std::unique_ptr<IFileWatcherBackend> backend_;
  std::filesystem::path folder_;
  std::atomic<bool> running_{false};
};

}  // namespace async
}  // namespace autofile_core
