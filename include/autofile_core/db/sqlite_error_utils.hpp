#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace autofile_core {

// Coarse grouping of SQLite result codes, used in journal error messages.
enum class DbErrorKind { Busy, Constraint, Storage, Schema, Other };

inline DbErrorKind db_error_kind(const sqlite::sqlite_exception& e) {
  switch (e.get_code() & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::Busy;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return DbErrorKind::Storage;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Other;
  }
}

// Another worker held the write lock past busy_timeout.
inline bool is_busy(const sqlite::sqlite_exception& e) {
  return db_error_kind(e) == DbErrorKind::Busy;
}

inline const char* to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::Busy: return "busy";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Storage: return "storage";
    case DbErrorKind::Schema: return "schema";
    case DbErrorKind::Other: return "other";
  }
  return "other";
}

// "journal <operation>: <kind>: <sqlite message> (code N)"
inline std::string format_db_error(const std::string& operation,
                                   const sqlite::sqlite_exception& e) {
  return "journal " + operation + ": " + to_string(db_error_kind(e)) + ": " + e.what() +
         " (code " + std::to_string(e.get_extended_code()) + ")";
}

}  // namespace autofile_core
