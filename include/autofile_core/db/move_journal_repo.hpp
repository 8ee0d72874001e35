#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "autofile_core/db/database_manager.hpp"
#include "autofile_core/db/models/journal_entry.hpp"

namespace autofile_core {

class MoveJournalRepoError : public std::exception {
 public:
  explicit MoveJournalRepoError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class MoveJournalRepo
 * @brief Persistent history of pipeline outcomes.
 *
 * Every moved, skipped or failed file gets one row. The journal is for
 * reporting only; it never feeds back into duplicate suppression.
 */
class MoveJournalRepo {
 public:
  explicit MoveJournalRepo(DatabaseManager& db_manager);
  virtual ~MoveJournalRepo() = default;

  // Returns the new row id
  virtual long long record(const PipelineResult& result);

  // Newest first
  std::vector<JournalEntry> list_recent(int limit = 50);
  std::vector<JournalEntry> list_by_status(PipelineStatus status, int limit = 50);

  // Returns the number of rows removed
  int clear_older_than(int older_than_days);

  // Destination folder of the most recent successful move
  std::optional<std::string> last_destination();

  static std::string time_point_to_string(const std::chrono::system_clock::time_point& tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace autofile_core
