#include "autofile_core/settle_detector.hpp"

#include <system_error>

namespace autofile_core {

SettleDetector::SettleDetector(SettleConfig cfg) : cfg_(cfg) {}

bool SettleDetector::is_ready(const std::filesystem::path& path) {
  return probe(path, nullptr);
}

bool SettleDetector::probe(const std::filesystem::path& path, WatchedFile* record) {
  std::error_code ec;
  const auto first = std::filesystem::file_size(path, ec);
  if (ec) {
    return false;
  }
  if (record) {
    record->size_history.push_back({std::chrono::steady_clock::now(), first});
  }

  if (!sleep_interval()) {
    return false;
  }

  const auto second = std::filesystem::file_size(path, ec);
  if (ec) {
    return false;
  }
  if (record) {
    record->size_history.push_back({std::chrono::steady_clock::now(), second});
  }
  return first == second && second > 0;
}

bool SettleDetector::wait_until_ready(WatchedFile& file) {
  file.state = FileState::Settling;

  for (int attempt = 0; attempt < cfg_.max_attempts; ++attempt) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file.path, ec)) {
      // Deleted or renamed away mid-probe
      file.state = FileState::Rejected;
      return false;
    }
    if (probe(file.path, &file)) {
      file.state = FileState::Ready;
      return true;
    }
    if (cancelled_.load()) {
      break;
    }
    if (attempt + 1 < cfg_.max_attempts && !sleep_interval()) {
      break;
    }
  }

  file.state = FileState::Rejected;
  return false;
}

void SettleDetector::cancel() {
  {
    std::lock_guard<std::mutex> lk(sleep_mu_);
    cancelled_.store(true);
  }
  sleep_cv_.notify_all();
}

bool SettleDetector::sleep_interval() {
  std::unique_lock<std::mutex> lk(sleep_mu_);
  return !sleep_cv_.wait_for(lk, cfg_.probe_interval, [this] { return cancelled_.load(); });
}

}  // namespace autofile_core
