#include "autofile_core/async/settle_check_task.hpp"

#include "autofile_core/async/service_provider.hpp"
#include "autofile_core/errors.hpp"
#include "autofile_core/logger.hpp"
#include "autofile_core/processed_set.hpp"
#include "autofile_core/settle_detector.hpp"

namespace autofile_core {
namespace async {

void SettleCheckTask::execute(ServiceProvider& services) {
  ProcessedSet& processed = services.get_processed_set();
  SettleDetector& settle = services.get_settle_detector();
  Logger& log = services.get_logger();
  WatcherCounters& counters = services.get_counters();

  if (processed.is_closed() || settle.is_cancelled()) {
    return;
  }
  if (processed.contains(path_)) {
    counters.claim_conflicts++;
    return;
  }

  if (!settle.wait_until_ready(file_)) {
    if (settle.is_cancelled()) {
      return;
    }
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
      log.info("Settle", "File vanished before settling: " + path_.string());
      return;
    }
    counters.settle_timeouts++;
    const SettleTimeout timeout("File did not settle after " +
                                std::to_string(file_.size_history.size()) +
                                " samples: " + path_.string());
    log.error("Settle", timeout.what());
    return;
  }

  if (!processed.try_claim(path_)) {
    counters.claim_conflicts++;
    return;
  }

  counters.arrivals_dispatched++;
  log.info("Watcher", "File ready (" + std::string(to_string(trigger_)) + "): " +
                          path_.string());
  services.dispatch_arrival(path_);
  file_.state = FileState::Processed;
}

}  // namespace async
}  // namespace autofile_core
