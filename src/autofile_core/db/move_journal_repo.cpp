#include "autofile_core/db/move_journal_repo.hpp"

#include <sqlite_modern_cpp.h>

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <thread>

#include "autofile_core/db/pooled_connection.hpp"
#include "autofile_core/db/sqlite_error_utils.hpp"
#include "autofile_core/db/transaction.hpp"

namespace autofile_core {

namespace {

const char* kSelectColumns =
    "SELECT id, source_path, destination_path, status, error_kind, message, ticket_number, "
    "title, created_at FROM move_journal ";

constexpr int kMaxBusyRetries = 3;

}  // namespace

MoveJournalRepo::MoveJournalRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

std::string MoveJournalRepo::time_point_to_string(
    const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct{};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point MoveJournalRepo::string_to_time_point(
    const std::string& time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

long long MoveJournalRepo::record(const PipelineResult& result) {
  std::optional<std::string> destination;
  if (result.destination) {
    destination = result.destination->string();
  }
  const std::string created_at = time_point_to_string(std::chrono::system_clock::now());

  // Workers journal concurrently; a busy database gets a few more tries
  for (int attempt = 1;; ++attempt) {
    try {
      PooledConnection conn(db_manager_);
      *conn << "INSERT INTO move_journal (source_path, destination_path, status, error_kind, "
               "message, ticket_number, title, created_at) VALUES (?,?,?,?,?,?,?,?)"
            << result.source.string() << destination << to_string(result.status)
            << to_string(result.error_kind) << result.message << result.ticket_number
            << result.title << created_at;
      return static_cast<long long>(conn->last_insert_rowid());
    } catch (const sqlite::sqlite_exception& e) {
      if (!is_busy(e) || attempt >= kMaxBusyRetries) {
        throw MoveJournalRepoError(format_db_error("record", e));
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50 * attempt));
    }
  }
}

std::vector<JournalEntry> MoveJournalRepo::list_recent(int limit) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<JournalEntry> entries;
    *conn << std::string(kSelectColumns) + "ORDER BY id DESC LIMIT ?" << limit >>
        [&](long long id, std::string source_path, std::optional<std::string> destination_path,
            std::string status, std::string error_kind, std::optional<std::string> message,
            std::optional<std::string> ticket_number, std::optional<std::string> title,
            std::string created_at) {
          JournalEntry entry;
          entry.id = id;
          entry.source_path = std::move(source_path);
          entry.destination_path = std::move(destination_path);
          entry.status = pipeline_status_from_string(status);
          entry.error_kind = pipeline_error_kind_from_string(error_kind);
          entry.message = message.value_or("");
          entry.ticket_number = std::move(ticket_number);
          entry.title = std::move(title);
          entry.created_at = string_to_time_point(created_at);
          entries.push_back(std::move(entry));
        };
    return entries;
  } catch (const sqlite::sqlite_exception& e) {
    throw MoveJournalRepoError(format_db_error("list_recent", e));
  }
}

std::vector<JournalEntry> MoveJournalRepo::list_by_status(PipelineStatus status, int limit) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<JournalEntry> entries;
    *conn << std::string(kSelectColumns) + "WHERE status = ? ORDER BY id DESC LIMIT ?"
          << to_string(status) << limit >>
        [&](long long id, std::string source_path, std::optional<std::string> destination_path,
            std::string status_db, std::string error_kind, std::optional<std::string> message,
            std::optional<std::string> ticket_number, std::optional<std::string> title,
            std::string created_at) {
          JournalEntry entry;
          entry.id = id;
          entry.source_path = std::move(source_path);
          entry.destination_path = std::move(destination_path);
          entry.status = pipeline_status_from_string(status_db);
          entry.error_kind = pipeline_error_kind_from_string(error_kind);
          entry.message = message.value_or("");
          entry.ticket_number = std::move(ticket_number);
          entry.title = std::move(title);
          entry.created_at = string_to_time_point(created_at);
          entries.push_back(std::move(entry));
        };
    return entries;
  } catch (const sqlite::sqlite_exception& e) {
    throw MoveJournalRepoError(format_db_error("list_by_status", e));
  }
}

int MoveJournalRepo::clear_older_than(int older_than_days) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    auto cutoff_time = std::chrono::system_clock::now() - std::chrono::hours(24 * older_than_days);
    std::string cutoff_str = time_point_to_string(cutoff_time);

    int count = 0;
    *conn << "SELECT COUNT(*) FROM move_journal WHERE created_at <= ?" << cutoff_str >> count;
    *conn << "DELETE FROM move_journal WHERE created_at <= ?" << cutoff_str;
    tx.commit();
    return count;
  } catch (const sqlite::sqlite_exception& e) {
    throw MoveJournalRepoError(format_db_error("clear_older_than", e));
  }
}

std::optional<std::string> MoveJournalRepo::last_destination() {
  try {
    PooledConnection conn(db_manager_);
    std::optional<std::string> result;
    *conn << "SELECT destination_path FROM move_journal WHERE status = ? AND "
             "destination_path IS NOT NULL ORDER BY id DESC LIMIT 1"
          << to_string(PipelineStatus::Moved) >>
        [&](std::string destination_path) {
          result = std::filesystem::path(destination_path).parent_path().string();
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw MoveJournalRepoError(format_db_error("last_destination", e));
  }
}

}  // namespace autofile_core
