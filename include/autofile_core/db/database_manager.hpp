#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "autofile_core/db/connection_pool.hpp"

namespace autofile_core {

// Owns the journal database: creates the schema once, then serves pooled
// connections. Constructed by the daemon and passed by reference.
class DatabaseManager {
 public:
  DatabaseManager() = default;
  ~DatabaseManager();

  // Must be called once before any repository is used
  void initialize(const std::filesystem::path& db_path, int pool_size);

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();
  bool is_initialized() const {
    return is_initialized_;
  }

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  void setup_schema(const std::filesystem::path& db_path);

  std::unique_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
};

}  // namespace autofile_core
