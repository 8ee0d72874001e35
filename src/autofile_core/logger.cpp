#include "autofile_core/logger.hpp"

#include <iostream>

#include "autofile_core/time_utils.hpp"

namespace autofile_core {

Logger::Logger(const std::filesystem::path& log_file) {
  if (log_file.empty()) {
    return;
  }
  std::error_code ec;
  if (log_file.has_parent_path()) {
    std::filesystem::create_directories(log_file.parent_path(), ec);
  }
  file_.open(log_file, std::ios::app);
  if (!file_.is_open()) {
    std::cerr << "[Logger] Could not open log file: " << log_file.string() << std::endl;
  }
}

void Logger::info(const std::string& component, const std::string& message) {
  write(component, message, false);
}

void Logger::error(const std::string& component, const std::string& message) {
  write(component, message, true);
}

void Logger::set_console_enabled(bool enabled) {
  std::lock_guard<std::mutex> lk(mu_);
  console_enabled_ = enabled;
}

void Logger::write(const std::string& component, const std::string& message, bool is_error) {
  const std::string line = "[" + component + "] " + message;
  std::lock_guard<std::mutex> lk(mu_);
  if (console_enabled_) {
    (is_error ? std::cerr : std::cout) << line << std::endl;
  }
  if (file_.is_open()) {
    file_ << "[" << format_local_time(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S")
          << "] " << line << '\n';
    file_.flush();
  }
}

}  // namespace autofile_core
