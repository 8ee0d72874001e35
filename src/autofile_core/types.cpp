#include <stdexcept>

#include "autofile_core/types/classification.hpp"
#include "autofile_core/types/pipeline_result.hpp"
#include "autofile_core/types/watched_file.hpp"

namespace autofile_core {

std::string to_string(FileState state) {
  switch (state) {
    case FileState::Discovered:
      return "Discovered";
    case FileState::Settling:
      return "Settling";
    case FileState::Ready:
      return "Ready";
    case FileState::Processed:
      return "Processed";
    case FileState::Rejected:
      return "Rejected";
    default:
      return "Unknown";
  }
}

std::string to_string(ClassificationKind kind) {
  switch (kind) {
    case ClassificationKind::Identified:
      return "Identified";
    default:
      return "Unidentified";
  }
}

std::string to_string(PipelineStatus status) {
  switch (status) {
    case PipelineStatus::Moved:
      return "MOVED";
    case PipelineStatus::Skipped:
      return "SKIPPED";
    case PipelineStatus::Failed:
      return "FAILED";
    default:
      return "FAILED";
  }
}

PipelineStatus pipeline_status_from_string(const std::string& str) {
  if (str == "MOVED") return PipelineStatus::Moved;
  if (str == "SKIPPED") return PipelineStatus::Skipped;
  if (str == "FAILED") return PipelineStatus::Failed;
  throw std::invalid_argument("Invalid PipelineStatus string: " + str);
}

}  // namespace autofile_core
