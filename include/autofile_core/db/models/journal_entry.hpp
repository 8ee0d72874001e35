#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "autofile_core/types/pipeline_result.hpp"

namespace autofile_core {

struct JournalEntry {
  long long id = 0;
  std::string source_path;
  std::optional<std::string> destination_path;
  PipelineStatus status = PipelineStatus::Skipped;
  PipelineErrorKind error_kind = PipelineErrorKind::None;
  std::string message;
  std::optional<std::string> ticket_number;
  std::optional<std::string> title;
  std::chrono::system_clock::time_point created_at;
};

}  // namespace autofile_core
