#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "autofile_api/config.hpp"
#include "autofile_api/routes.hpp"
#include "autofile_api/server.hpp"
#include "autofile_core/async/event_debouncer.hpp"
#include "autofile_core/async/file_watcher_service.hpp"
#include "autofile_core/async/result_queue.hpp"
#include "autofile_core/async/service_provider.hpp"
#include "autofile_core/async/task_queue.hpp"
#include "autofile_core/async/timer_scheduler.hpp"
#include "autofile_core/async/worker_pool.hpp"
#include "autofile_core/classifier.hpp"
#include "autofile_core/db/database_manager.hpp"
#include "autofile_core/db/move_journal_repo.hpp"
#include "autofile_core/file_mover.hpp"
#include "autofile_core/logger.hpp"
#include "autofile_core/notifier.hpp"
#include "autofile_core/processed_set.hpp"
#include "autofile_core/provenance/provenance_reader.hpp"
#include "autofile_core/services/download_scan_service.hpp"
#include "autofile_core/services/folder_browser.hpp"
#include "autofile_core/services/organizer_service.hpp"
#include "autofile_core/settle_detector.hpp"
#include "autofile_core/tracker/credential_store.hpp"
#include "autofile_core/tracker/tracker_client.hpp"

std::atomic<bool> shutdown_requested = false;

void signal_handler(int signal) {
  (void)signal;
  shutdown_requested = true;
}

namespace {

// API key first, then remembered credentials. A failed login leaves the
// daemon running with automatic filing reduced to notifications.
void try_auto_login(autofile_core::TrackerClient& tracker,
                    autofile_core::CredentialStore& credentials,
                    const std::string& api_key,
                    autofile_core::Logger& logger) {
  try {
    if (!api_key.empty()) {
      if (tracker.login_with_api_key()) {
        logger.info("Tracker", "Logged in with API key");
      } else {
        logger.error("Tracker", "API key was rejected");
      }
      return;
    }
    auto stored = credentials.load();
    if (!stored) {
      logger.info("Tracker", "No stored credentials; use 'autofile login' to sign in");
      return;
    }
    if (tracker.login(stored->username, stored->password)) {
      logger.info("Tracker", "Logged in as " + stored->username);
    } else {
      logger.error("Tracker", "Stored credentials were rejected for " + stored->username);
    }
  } catch (const std::exception& e) {
    logger.error("Tracker", std::string("Auto-login failed: ") + e.what());
  }
}

}  // namespace

int main() {
  try {
    autofile_api::Config config = autofile_api::Config::from_file("autofilerc.json");

    std::unique_ptr<autofile_core::Logger> logger =
        config.log_file.empty() ? std::make_unique<autofile_core::Logger>()
                                : std::make_unique<autofile_core::Logger>(config.log_file);

    logger->info("Main", "Starting Autofile daemon...");
    logger->info("Main", "Server URL: " + config.api_base_url);
    logger->info("Main", "Journal DB Path: " + config.journal_db_path);
    logger->info("Main", "Destination Root: " + config.destination_root);
    logger->info("Main", std::string("File Watcher Enabled: ") +
                             (config.file_watcher_enabled ? "Yes" : "No"));
    if (config.file_watcher_enabled) {
      logger->info("Main", "Watch Directory: " + config.watch_directory);
    }
    if (config.trusted_host.empty()) {
      logger->error("Main", "trusted_host is not set; no download will be identified");
    }

    for (const auto& dir : {config.watch_directory, config.destination_root}) {
      std::error_code ec;
      std::filesystem::create_directories(dir, ec);
      if (ec) {
        logger->error("Main", "Failed to create directory " + dir + ": " + ec.message());
      }
    }

    // --- 1. CORE COMPONENTS ---
    autofile_core::DatabaseManager db_manager;
    db_manager.initialize(config.journal_db_path, /*pool_size*/ config.num_workers + 1);
    autofile_core::MoveJournalRepo journal(db_manager);

    autofile_core::TrackerClient tracker(config.tracker_url, config.tracker_api_key);
    autofile_core::CredentialStore credentials(config.credentials_path);
    if (!config.tracker_url.empty()) {
      try_auto_login(tracker, credentials, config.tracker_api_key, *logger);
    }

    auto provenance = autofile_core::make_default_provenance_reader();
    autofile_core::Classifier classifier(*provenance, config.trusted_host);
    autofile_core::FileMover mover;
    autofile_core::ConsoleNotifier notifier(*logger);
    autofile_core::async::ResultQueue results;

    autofile_core::OrganizerConfig organizer_config;
    organizer_config.destination_root = config.destination_root;
    organizer_config.auto_organize = config.auto_organize;
    autofile_core::OrganizerService organizer(organizer_config, classifier, tracker, mover,
                                              notifier, *logger, &journal, &results);
    autofile_core::DownloadScanService scanner(config.watch_directory, classifier);
    autofile_core::FolderBrowser folders(config.destination_root);

    // --- 2. ARRIVAL PIPELINE ---
    autofile_core::SettleConfig settle_config;
    settle_config.probe_interval = std::chrono::milliseconds(config.settle_probe_interval_ms);
    settle_config.max_attempts = config.settle_max_attempts;
    autofile_core::SettleDetector settle(settle_config);
    autofile_core::ProcessedSet processed;
    autofile_core::ServiceProvider services(settle, processed, *logger);

    autofile_core::async::TaskQueue task_queue;
    autofile_core::async::WorkerPool worker_pool(static_cast<size_t>(config.num_workers),
                                                 task_queue, services);
    autofile_core::async::TimerScheduler scheduler(task_queue);

    autofile_core::async::DebounceConfig debounce_config;
    debounce_config.created_delay = std::chrono::milliseconds(config.created_delay_ms);
    debounce_config.moved_delay = std::chrono::milliseconds(config.moved_delay_ms);
    debounce_config.modified_delay = std::chrono::milliseconds(config.modified_delay_ms);
    debounce_config.ignore_suffixes = config.ignore_suffixes;
    autofile_core::async::EventDebouncer debouncer(debounce_config, scheduler, services);

    autofile_core::async::WatchConfig watch_config;
    watch_config.seed_existing_files = config.seed_existing_files;
    autofile_core::async::FileWatcherService watcher(watch_config, debouncer, services);
    watcher.set_arrival_handler(
        [&organizer](const std::filesystem::path& path) { organizer.organize_arrival(path); });

    autofile_api::Server server(config.host(), config.port());
    autofile_api::Routes routes({organizer, watcher, scanner, folders, journal, tracker,
                                 credentials, *logger, config.watch_directory});
    routes.register_routes(server);

    // --- 3. START BACKGROUND SERVICES ---
    server.get_app().signal_clear();

    worker_pool.start();
    scheduler.start();

    if (config.file_watcher_enabled) {
      logger->info("Main", "Starting file watcher service...");
      watcher.start_watching(config.watch_directory);
    }

    server.start();
    logger->info("Main", "Server started successfully. Press Ctrl+C to exit.");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // --- 4. MAIN LOOP: report filing outcomes until shutdown ---
    while (!shutdown_requested.load()) {
      for (const auto& result : results.drain(std::chrono::milliseconds(250))) {
        organizer.report(result);
      }
    }
    logger->info("Main", "Shutdown signal received. Initiating graceful shutdown...");

    // --- 5. GRACEFUL SHUTDOWN SEQUENCE ---
    logger->info("Main", "[1/5] Stopping API server to refuse new requests...");
    server.stop();

    logger->info("Main", "[2/5] Stopping file watcher...");
    organizer.cancel_batch();
    watcher.stop_watching();
    const std::size_t dropped = scheduler.stop();
    if (dropped > 0) {
      logger->info("Main", "Dropped " + std::to_string(dropped) + " pending settle checks");
    }

    logger->info("Main", "[3/5] Cancelling settle checks and stopping workers...");
    settle.cancel();
    processed.close();
    task_queue.close();
    worker_pool.stop();

    logger->info("Main", "[4/5] Reporting remaining results...");
    while (auto result = results.try_pop()) {
      organizer.report(*result);
    }

    logger->info("Main", "[5/5] Shutting down database connections...");
    db_manager.shutdown();

    logger->info("Main", "Shutdown complete.");
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
