#include "autofile_core/services/organizer_service.hpp"

#include <thread>

#include "autofile_core/async/result_queue.hpp"
#include "autofile_core/classifier.hpp"
#include "autofile_core/db/move_journal_repo.hpp"
#include "autofile_core/errors.hpp"
#include "autofile_core/logger.hpp"
#include "autofile_core/notifier.hpp"
#include "autofile_core/provenance/provenance_reader.hpp"
#include "autofile_core/tracker/title_lookup.hpp"

namespace autofile_core {

OrganizerService::OrganizerService(OrganizerConfig cfg,
                                   const Classifier& classifier,
                                   ITitleLookup& title_lookup,
                                   FileMover& mover,
                                   INotifier& notifier,
                                   Logger& logger,
                                   MoveJournalRepo* journal,
                                   async::ResultQueue* results)
    : cfg_(std::move(cfg)),
      classifier_(classifier),
      title_lookup_(title_lookup),
      mover_(mover),
      notifier_(notifier),
      logger_(logger),
      journal_(journal),
      results_(results),
      auto_organize_(cfg_.auto_organize) {}

void OrganizerService::set_auto_organize(bool enabled) {
  auto_organize_.store(enabled);
  logger_.info("Organizer", std::string("Auto-organize ") + (enabled ? "enabled" : "disabled"));
}

bool OrganizerService::auto_organize_enabled() const {
  return auto_organize_.load();
}

MovedPath OrganizerService::file_by_title(const std::filesystem::path& path,
                                          const std::string& title) {
  const auto labels = parse_label(title);
  if (!labels) {
    throw UnrecognizedLabel(title);
  }
  const DestinationPlan plan = PathBuilder::build_destination(
      *labels, PathBuilder::reference_time_for(path), cfg_.destination_root);
  return relocate(path, plan.target_directory, CollisionPolicy::Timestamp);
}

MovedPath OrganizerService::relocate(const std::filesystem::path& path,
                                     const std::filesystem::path& target_directory,
                                     CollisionPolicy policy) {
  MovedPath moved = mover_.move(path, target_directory, policy);
  const std::error_code ec = relocate_zone_identifier(path, moved);
  if (ec) {
    logger_.error("Organizer", "Zone.Identifier of " + path.filename().string() +
                                   " left in place: " + ec.message());
  }
  return moved;
}

OrganizerService::Filed OrganizerService::file_by_ticket(const std::filesystem::path& path,
                                                         const std::string& ticket_number) {
  Filed filed;
  filed.ticket_number = ticket_number;
  filed.title = title_lookup_.lookup_title(ticket_number);
  logger_.info("Organizer", "Ticket #" + ticket_number + " title: " + filed.title);
  filed.destination = file_by_title(path, filed.title);
  return filed;
}

PipelineResult OrganizerService::organize_arrival(const std::filesystem::path& path) {
  PipelineResult result;
  result.source = path;

  try {
    const Classification classification = classifier_.classify(path);
    if (!classification.is_identified()) {
      result.status = PipelineStatus::Skipped;
      result.error_kind = PipelineErrorKind::NotIdentified;
      result.message = "No tracker provenance";
      deliver(result);
      return result;
    }
    result.ticket_number = classification.ticket_number;

    if (!auto_organize_enabled()) {
      result.status = PipelineStatus::Skipped;
      result.message = "Auto-organize is off";
    } else if (!title_lookup_.is_logged_in()) {
      result.status = PipelineStatus::Skipped;
      result.message = "Not logged in to the tracker";
    } else if (!classification.ticket_number) {
      result.status = PipelineStatus::Skipped;
      result.message = "No ticket number in provenance";
    } else {
      Filed filed = file_by_ticket(path, *classification.ticket_number);
      result.status = PipelineStatus::Moved;
      result.title = filed.title;
      result.destination = filed.destination;
      result.message = "Filed to " + filed.destination.parent_path().string();
    }
  } catch (const UnrecognizedLabel& e) {
    result.status = PipelineStatus::Failed;
    result.error_kind = e.kind();
    result.title = e.title();
    result.message = e.what();
  } catch (const AutofileError& e) {
    result.status = PipelineStatus::Failed;
    result.error_kind = e.kind();
    result.message = e.what();
  } catch (const std::exception& e) {
    result.status = PipelineStatus::Failed;
    result.error_kind = PipelineErrorKind::Internal;
    result.message = e.what();
  }

  journal(result);
  deliver(result);
  return result;
}

void OrganizerService::report(const PipelineResult& result) {
  const std::string filename = result.source.filename().string();
  const std::string ticket =
      result.ticket_number ? "#" + *result.ticket_number : std::string("unknown");

  switch (result.status) {
    case PipelineStatus::Moved:
      logger_.info("Organizer", "Moved " + filename + " -> " +
                                    (result.destination ? result.destination->string() : ""));
      notifier_.notify("Filed", filename + " -> " +
                                    (result.destination
                                         ? result.destination->parent_path().string()
                                         : std::string()));
      break;
    case PipelineStatus::Failed:
      logger_.error("Organizer", "Failed to file " + filename + " [" +
                                     to_string(result.error_kind) + "]: " + result.message);
      notifier_.notify("Filing failed", filename + ": " + result.message);
      break;
    case PipelineStatus::Skipped:
      if (result.error_kind == PipelineErrorKind::NotIdentified) {
        logger_.info("Organizer", "Ignoring " + filename + ": " + result.message);
      } else {
        logger_.info("Organizer",
                     "Detected " + filename + " (ticket " + ticket + "), " + result.message);
        notifier_.notify("File detected", filename + " (ticket " + ticket + ")");
      }
      break;
  }
}

MovedPath OrganizerService::process_one(const std::filesystem::path& path,
                                        const std::optional<std::string>& manual_title) {
  PipelineResult result;
  result.source = path;

  try {
    if (manual_title) {
      result.title = *manual_title;
      result.destination = file_by_title(path, *manual_title);
    } else {
      const Classification classification = classifier_.classify(path);
      if (!classification.is_identified()) {
        throw NotIdentified("No tracker provenance on " + path.string());
      }
      if (!classification.ticket_number) {
        throw NotIdentified("No ticket number in provenance of " + path.string());
      }
      result.ticket_number = classification.ticket_number;
      Filed filed = file_by_ticket(path, *classification.ticket_number);
      result.title = filed.title;
      result.destination = filed.destination;
    }
  } catch (const AutofileError& e) {
    result.status = PipelineStatus::Failed;
    result.error_kind = e.kind();
    result.message = e.what();
    journal(result);
    throw;
  }

  result.status = PipelineStatus::Moved;
  result.message = "Filed to " + result.destination->parent_path().string();
  journal(result);
  logger_.info("Organizer", "Moved " + path.filename().string() + " -> " +
                                result.destination->string());
  return *result.destination;
}

DestinationPlan OrganizerService::preview(const std::filesystem::path& path,
                                          const std::string& title) const {
  const auto labels = parse_label(title);
  if (!labels) {
    throw UnrecognizedLabel(title);
  }
  return PathBuilder::build_destination(*labels, PathBuilder::reference_time_for(path),
                                        cfg_.destination_root);
}

BatchResult OrganizerService::organize_all(const std::vector<DownloadEntry>& entries) {
  if (!title_lookup_.is_logged_in()) {
    throw LookupFailure("Log in to the tracker before organizing");
  }

  batch_cancelled_.store(false);
  BatchResult batch;
  bool first = true;

  for (const auto& entry : entries) {
    if (batch_cancelled_.load()) {
      logger_.info("Organizer", "Batch cancelled");
      break;
    }
    if (!entry.classification.ticket_number) {
      continue;
    }
    if (!first) {
      std::this_thread::sleep_for(cfg_.batch_pause);
    }
    first = false;

    PipelineResult result;
    result.source = entry.path;
    result.ticket_number = entry.classification.ticket_number;
    try {
      Filed filed = file_by_ticket(entry.path, *entry.classification.ticket_number);
      result.status = PipelineStatus::Moved;
      result.title = filed.title;
      result.destination = filed.destination;
      result.message = "Filed to " + filed.destination.parent_path().string();
      batch.last_folder = filed.destination.parent_path();
      ++batch.succeeded;
    } catch (const UnrecognizedLabel& e) {
      result.status = PipelineStatus::Skipped;
      result.error_kind = e.kind();
      result.title = e.title();
      result.message = e.what();
      ++batch.skipped;
    } catch (const AutofileError& e) {
      result.status = PipelineStatus::Failed;
      result.error_kind = e.kind();
      result.message = e.what();
      ++batch.failed;
    }
    journal(result);
    batch.results.push_back(std::move(result));
  }

  logger_.info("Organizer", "Batch done: " + std::to_string(batch.succeeded) + " moved, " +
                                std::to_string(batch.failed) + " failed, " +
                                std::to_string(batch.skipped) + " skipped");
  return batch;
}

void OrganizerService::cancel_batch() {
  batch_cancelled_.store(true);
}

MovedPath OrganizerService::move_to_folder(const std::filesystem::path& path,
                                           const std::filesystem::path& target_folder) {
  PipelineResult result;
  result.source = path;
  try {
    result.destination = relocate(path, target_folder, CollisionPolicy::NumberedSuffix);
  } catch (const MoveError& e) {
    result.status = PipelineStatus::Failed;
    result.error_kind = e.kind();
    result.message = e.what();
    journal(result);
    throw;
  }
  result.status = PipelineStatus::Moved;
  result.message = "Moved to " + target_folder.string();
  journal(result);
  logger_.info("Organizer", "Moved " + path.filename().string() + " -> " +
                                result.destination->string());
  return *result.destination;
}

void OrganizerService::journal(const PipelineResult& result) {
  if (!journal_) {
    return;
  }
  try {
    journal_->record(result);
  } catch (const std::exception& e) {
    logger_.error("Organizer", std::string("Journal write failed: ") + e.what());
  }
}

void OrganizerService::deliver(const PipelineResult& result) {
  if (results_) {
    results_->post(result);
  } else {
    report(result);
  }
}

}  // namespace autofile_core
