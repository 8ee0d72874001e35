#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "autofile_core/errors.hpp"

namespace autofile_core {

enum class PipelineStatus { Moved, Skipped, Failed };

std::string to_string(PipelineStatus status);
PipelineStatus pipeline_status_from_string(const std::string& str);

// Outcome of filing one file, produced on a worker and consumed by the daemon.
struct PipelineResult {
  std::filesystem::path source;
  PipelineStatus status = PipelineStatus::Skipped;
  PipelineErrorKind error_kind = PipelineErrorKind::None;
  std::string message;
  std::optional<std::filesystem::path> destination;
  std::optional<std::string> ticket_number;
  std::optional<std::string> title;

  bool moved() const {
    return status == PipelineStatus::Moved;
  }
};

}  // namespace autofile_core
