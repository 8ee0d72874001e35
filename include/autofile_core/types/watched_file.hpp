#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace autofile_core {

enum class FileState { Discovered, Settling, Ready, Processed, Rejected };

std::string to_string(FileState state);

struct SizeSample {
  std::chrono::steady_clock::time_point taken_at;
  std::uintmax_t size = 0;
};

// One filesystem entry under observation, from notification until it is
// either handed to the mover or abandoned.
struct WatchedFile {
  std::filesystem::path path;
  std::vector<SizeSample> size_history;
  FileState state = FileState::Discovered;

  explicit WatchedFile(std::filesystem::path p) : path(std::move(p)) {}

  bool is_terminal() const {
    return state == FileState::Processed || state == FileState::Rejected;
  }
};

}  // namespace autofile_core
