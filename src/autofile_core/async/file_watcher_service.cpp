#include "autofile_core/async/file_watcher_service.hpp"

#include <stdexcept>

#include "autofile_core/async/event_debouncer.hpp"
#include "autofile_core/async/service_provider.hpp"
#include "autofile_core/logger.hpp"
#include "autofile_core/processed_set.hpp"

namespace autofile_core::async {

FileWatcherService::FileWatcherService(const WatchConfig& cfg,
                                       EventDebouncer& debouncer,
                                       ServiceProvider& services,
                                       BackendFactory backend_factory)
    : cfg_(cfg),
      debouncer_(debouncer),
      services_(services),
      backend_factory_(std::move(backend_factory)) {}

FileWatcherService::~FileWatcherService() {
  stop_watching();
}

void FileWatcherService::start_watching(const std::filesystem::path& folder) {
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    throw std::runtime_error("Watch folder does not exist or is not a directory: " +
                             folder.string());
  }

  stop_watching();

  const auto root = std::filesystem::absolute(folder, ec).lexically_normal();
  Logger& log = services_.get_logger();

  if (cfg_.seed_existing_files) {
    const auto seeded = services_.get_processed_set().seed_from_directory(root);
    services_.get_counters().files_seeded += seeded;
    log.info("Watcher", "Seeded " + std::to_string(seeded) + " existing entries from " +
                            root.string());
  }

  std::lock_guard<std::mutex> lk(mu_);
  backend_ = backend_factory_(root, [this](const FileWatchEvent& ev) { on_backend_event(ev); });
  if (!backend_) {
    throw std::runtime_error("No file watcher backend available for " + root.string());
  }
  backend_->start();
  folder_ = root;
  running_.store(true);
  log.info("Watcher", "Watching " + root.string());
}

void FileWatcherService::stop_watching() {
  std::unique_ptr<IFileWatcherBackend> backend;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_.load()) return;
    running_.store(false);
    backend = std::move(backend_);
  }
  if (backend) {
    backend->stop();
  }
  services_.get_logger().info("Watcher", "Stopped watching " + watched_folder().string());
}

std::filesystem::path FileWatcherService::watched_folder() const {
  std::lock_guard<std::mutex> lk(mu_);
  return folder_;
}

void FileWatcherService::set_arrival_handler(
    std::function<void(const std::filesystem::path&)> handler) {
  services_.set_arrival_handler(std::move(handler));
}

std::size_t FileWatcherService::rescan() {
  const auto folder = watched_folder();
  std::size_t scheduled = 0;
  std::error_code ec;
  const auto opts = std::filesystem::directory_options::skip_permission_denied;
  for (std::filesystem::directory_iterator it(folder, opts, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code ec2;
    if (!it->is_regular_file(ec2)) continue;

    FileWatchEvent ev;
    ev.path = it->path();
    ev.kind = EventKind::Created;
    ev.ts = std::chrono::system_clock::now();
    if (debouncer_.on_event(ev)) {
      ++scheduled;
    }
  }
  if (ec) {
    services_.get_logger().error("Watcher", "Rescan error: " + ec.message());
  }
  return scheduled;
}

WatcherStats FileWatcherService::stats() const {
  return services_.get_counters().snapshot();
}

void FileWatcherService::on_backend_event(const FileWatchEvent& ev) {
  if (ev.kind == EventKind::Overflow) {
    services_.get_counters().overflows++;
    services_.get_logger().error("Watcher", "Event queue overflow, rescanning");
    rescan();
    return;
  }
  debouncer_.on_event(ev);
}

}  // namespace autofile_core::async
