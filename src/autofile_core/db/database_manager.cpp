#include "autofile_core/db/database_manager.hpp"

#include <stdexcept>

namespace autofile_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema first, on a single non-pooled connection
  setup_schema(db_path);

  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);
  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  sqlite::database db(db_path.string());
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS move_journal (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          source_path TEXT NOT NULL,
          destination_path TEXT,
          status TEXT NOT NULL,
          error_kind TEXT NOT NULL DEFAULT 'NONE',
          message TEXT,
          ticket_number TEXT,
          title TEXT,
          created_at TEXT NOT NULL
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_move_journal_status_created
      ON move_journal(status, created_at)
    )";
}

}  // namespace autofile_core
