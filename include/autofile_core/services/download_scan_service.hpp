#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "autofile_core/types/classification.hpp"

namespace autofile_core {

class Classifier;

struct DownloadEntry {
  std::filesystem::path path;
  std::string filename;
  Classification classification;
  std::chrono::system_clock::time_point mtime;
};

// One-shot listing of the watch folder for the manual flows.
class DownloadScanService {
 public:
  DownloadScanService(std::filesystem::path watch_directory, const Classifier& classifier);
  virtual ~DownloadScanService() = default;

  // Identified regular files, newest mtime first. Empty if the folder is missing.
  virtual std::vector<DownloadEntry> scan() const;

  const std::filesystem::path& watch_directory() const {
    return watch_directory_;
  }

 private:
  std::filesystem::path watch_directory_;
  const Classifier& classifier_;
};

}  // namespace autofile_core
