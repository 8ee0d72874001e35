#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "autofile_core/types/classification.hpp"

namespace autofile_core {

struct DestinationPlan {
  std::filesystem::path target_directory;
  int levels = 0;
};

/**
 * @class PathBuilder
 * @brief Turns parsed title labels into the dated destination folder.
 *
 * The layout is base_root / seg1 / seg2 [/ seg3] / YYYYMMDD, with the date in
 * local time. build_destination() does no I/O, so identical inputs always give
 * the same plan.
 */
class PathBuilder {
 public:
  static DestinationPlan build_destination(const Labels& labels,
                                           std::chrono::system_clock::time_point reference_time,
                                           const std::filesystem::path& base_root);

  // mtime of path, or now() when the file cannot be stat'ed.
  static std::chrono::system_clock::time_point reference_time_for(
      const std::filesystem::path& path);

  static std::string format_date_folder(std::chrono::system_clock::time_point tp);

  // Makes a label usable as one path component: trims it, replaces reserved
  // and control characters with '_', and maps "", "." and ".." to "_".
  static std::string sanitize_segment(const std::string& segment);
};

}  // namespace autofile_core
