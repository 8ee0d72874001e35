#include "autofile_core/path_builder.hpp"

#include <stdexcept>

#include "autofile_core/time_utils.hpp"

namespace autofile_core {

namespace {

constexpr const char* kReservedChars = "<>:\"/\\|?*";

}  // namespace

DestinationPlan PathBuilder::build_destination(const Labels& labels,
                                               std::chrono::system_clock::time_point reference_time,
                                               const std::filesystem::path& base_root) {
  if (labels.levels() < 2 || labels.levels() > 3) {
    throw std::invalid_argument("Labels must have 2 or 3 segments, got " +
                                std::to_string(labels.levels()));
  }

  DestinationPlan plan;
  plan.target_directory = base_root;
  for (const auto& segment : labels.segments) {
    plan.target_directory /= sanitize_segment(segment);
  }
  plan.target_directory /= format_date_folder(reference_time);
  plan.levels = labels.levels();
  return plan;
}

std::chrono::system_clock::time_point PathBuilder::reference_time_for(
    const std::filesystem::path& path) {
  std::error_code ec;
  auto ftime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return std::chrono::system_clock::now();
  }
  return to_system_time(ftime);
}

std::string PathBuilder::format_date_folder(std::chrono::system_clock::time_point tp) {
  return format_local_time(tp, "%Y%m%d");
}

std::string PathBuilder::sanitize_segment(const std::string& segment) {
  const auto first = segment.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "_";
  }
  const auto last = segment.find_last_not_of(" \t\r\n");
  std::string out = segment.substr(first, last - first + 1);

  for (auto& c : out) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7f || std::string(kReservedChars).find(c) != std::string::npos) {
      c = '_';
    }
  }
  if (out == "." || out == "..") {
    return "_";
  }
  return out;
}

}  // namespace autofile_core
