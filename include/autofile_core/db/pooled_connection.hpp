#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>
#include <stdexcept>

#include "autofile_core/db/database_manager.hpp"

namespace autofile_core {

// RAII guard: borrows a connection for its lifetime.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager)
      : manager_(manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw std::runtime_error("Failed to acquire database connection: system is shutting down.");
    }
  }

  ~PooledConnection() {
    if (conn_) {
      manager_.return_connection(std::move(conn_));
    }
  }

  sqlite::database* operator->() const {
    return conn_.get();
  }
  sqlite::database& operator*() const {
    return *conn_;
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

 private:
  DatabaseManager& manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace autofile_core
