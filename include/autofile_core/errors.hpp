#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace autofile_core {

// Failure categories surfaced by the filing pipeline. ClaimConflict is not an
// error condition, it is reported when a path was already claimed.
enum class PipelineErrorKind {
  None,
  SettleTimeout,
  LookupFailure,
  UnrecognizedLabel,
  MoveError,
  ClaimConflict,
  NotIdentified,
  Internal
};

inline std::string to_string(PipelineErrorKind kind) {
  switch (kind) {
    case PipelineErrorKind::None: return "NONE";
    case PipelineErrorKind::SettleTimeout: return "SETTLE_TIMEOUT";
    case PipelineErrorKind::LookupFailure: return "LOOKUP_FAILURE";
    case PipelineErrorKind::UnrecognizedLabel: return "UNRECOGNIZED_LABEL";
    case PipelineErrorKind::MoveError: return "MOVE_ERROR";
    case PipelineErrorKind::ClaimConflict: return "CLAIM_CONFLICT";
    case PipelineErrorKind::NotIdentified: return "NOT_IDENTIFIED";
    case PipelineErrorKind::Internal: return "INTERNAL";
  }
  return "INTERNAL";
}

inline PipelineErrorKind pipeline_error_kind_from_string(const std::string& str) {
  if (str == "NONE") return PipelineErrorKind::None;
  if (str == "SETTLE_TIMEOUT") return PipelineErrorKind::SettleTimeout;
  if (str == "LOOKUP_FAILURE") return PipelineErrorKind::LookupFailure;
  if (str == "UNRECOGNIZED_LABEL") return PipelineErrorKind::UnrecognizedLabel;
  if (str == "MOVE_ERROR") return PipelineErrorKind::MoveError;
  if (str == "CLAIM_CONFLICT") return PipelineErrorKind::ClaimConflict;
  if (str == "NOT_IDENTIFIED") return PipelineErrorKind::NotIdentified;
  if (str == "INTERNAL") return PipelineErrorKind::Internal;
  throw std::invalid_argument("Invalid PipelineErrorKind string: " + str);
}

class AutofileError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;

  virtual PipelineErrorKind kind() const noexcept {
    return PipelineErrorKind::Internal;
  }
};

class SettleTimeout : public AutofileError {
 public:
  using AutofileError::AutofileError;
  PipelineErrorKind kind() const noexcept override {
    return PipelineErrorKind::SettleTimeout;
  }
};

// Provenance or title lookup failed (network, auth, not found, bad payload).
class LookupFailure : public AutofileError {
 public:
  using AutofileError::AutofileError;
  PipelineErrorKind kind() const noexcept override {
    return PipelineErrorKind::LookupFailure;
  }
};

class UnrecognizedLabel : public AutofileError {
 public:
  explicit UnrecognizedLabel(const std::string& title)
      : AutofileError("Title does not match the [segment] format: " + title), title_(title) {}

  PipelineErrorKind kind() const noexcept override {
    return PipelineErrorKind::UnrecognizedLabel;
  }
  const std::string& title() const {
    return title_;
  }

 private:
  std::string title_;
};

// File carries no provenance pointing at the tracker, or no ticket number.
class NotIdentified : public AutofileError {
 public:
  using AutofileError::AutofileError;
  PipelineErrorKind kind() const noexcept override {
    return PipelineErrorKind::NotIdentified;
  }
};

class MoveError : public AutofileError {
 public:
  MoveError(const std::string& message, std::error_code cause)
      : AutofileError(cause ? message + ": " + cause.message() : message), cause_(cause) {}

  PipelineErrorKind kind() const noexcept override {
    return PipelineErrorKind::MoveError;
  }
  std::error_code cause() const {
    return cause_;
  }

 private:
  std::error_code cause_;
};

}  // namespace autofile_core
