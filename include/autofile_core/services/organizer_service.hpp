#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "autofile_core/file_mover.hpp"
#include "autofile_core/path_builder.hpp"
#include "autofile_core/services/download_scan_service.hpp"
#include "autofile_core/types/pipeline_result.hpp"

namespace autofile_core {

class Classifier;
class ITitleLookup;
class INotifier;
class Logger;
class MoveJournalRepo;

namespace async {
class ResultQueue;
}

struct OrganizerConfig {
  std::filesystem::path destination_root;
  bool auto_organize = true;
  // Pause between files in organize_all (tracker load)
  std::chrono::milliseconds batch_pause{500};
};

struct BatchResult {
  int succeeded = 0;
  int failed = 0;
  int skipped = 0;
  std::optional<std::filesystem::path> last_folder;
  std::vector<PipelineResult> results;
};

/**
 * @class OrganizerService
 * @brief Classification-to-destination pipeline, automatic and manual.
 *
 * Automatic filing (organize_arrival) is called from worker threads for every
 * claimed arrival. It never throws: the outcome is journaled and either
 * posted to the ResultQueue or, when none is attached, reported right away.
 *
 * The manual entry points (process_one, preview, move_to_folder) throw the
 * typed errors from errors.hpp so the caller can show them.
 */
class OrganizerService {
 public:
  OrganizerService(OrganizerConfig cfg,
                   const Classifier& classifier,
                   ITitleLookup& title_lookup,
                   FileMover& mover,
                   INotifier& notifier,
                   Logger& logger,
                   MoveJournalRepo* journal = nullptr,
                   async::ResultQueue* results = nullptr);
  virtual ~OrganizerService() = default;

  OrganizerService(const OrganizerService&) = delete;
  OrganizerService& operator=(const OrganizerService&) = delete;

  PipelineResult organize_arrival(const std::filesystem::path& path);

  // Consumer side of the ResultQueue: logs and notifies one outcome.
  void report(const PipelineResult& result);

  /**
   * @brief Files one download now.
   * @param manual_title Title to use instead of the tracker lookup.
   * @throws NotIdentified, LookupFailure, UnrecognizedLabel, MoveError
   */
  MovedPath process_one(const std::filesystem::path& path,
                        const std::optional<std::string>& manual_title = std::nullopt);

  // Planned destination for path under title. Throws UnrecognizedLabel.
  DestinationPlan preview(const std::filesystem::path& path, const std::string& title) const;

  // Files every entry with a ticket number. Throws LookupFailure when the
  // tracker is not logged in.
  BatchResult organize_all(const std::vector<DownloadEntry>& entries);
  void cancel_batch();

  // Manual folder choice; collisions get _1, _2, ... suffixes.
  MovedPath move_to_folder(const std::filesystem::path& path,
                           const std::filesystem::path& target_folder);

  void set_auto_organize(bool enabled);
  bool auto_organize_enabled() const;

  const std::filesystem::path& destination_root() const {
    return cfg_.destination_root;
  }

 private:
  struct Filed {
    MovedPath destination;
    std::string ticket_number;
    std::string title;
  };

  Filed file_by_ticket(const std::filesystem::path& path, const std::string& ticket_number);
  MovedPath file_by_title(const std::filesystem::path& path, const std::string& title);
  // Mover call plus the Zone.Identifier sidecar, which follows the file
  MovedPath relocate(const std::filesystem::path& path,
                     const std::filesystem::path& target_directory,
                     CollisionPolicy policy);
  void journal(const PipelineResult& result);
  void deliver(const PipelineResult& result);

  OrganizerConfig cfg_;
  const Classifier& classifier_;
  ITitleLookup& title_lookup_;
  FileMover& mover_;
  INotifier& notifier_;
  Logger& logger_;
  MoveJournalRepo* journal_;
  async::ResultQueue* results_;

  std::atomic<bool> auto_organize_;
  std::atomic<bool> batch_cancelled_{false};
};

}  // namespace autofile_core
