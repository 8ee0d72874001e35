#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace autofile_core {

/**
 * @class Logger
 * @brief Append-only diagnostic sink shared by every component.
 *
 * Lines are written as "[Component] message" to stdout (info) or stderr
 * (errors). When a log file is configured every line is also appended to it
 * with a local timestamp prefix. Safe to call from any thread.
 */
class Logger {
 public:
  Logger() = default;
  explicit Logger(const std::filesystem::path& log_file);
  virtual ~Logger() = default;

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  virtual void info(const std::string& component, const std::string& message);
  virtual void error(const std::string& component, const std::string& message);

  // Silences console output (used by tests); the log file is unaffected.
  void set_console_enabled(bool enabled);

 private:
  void write(const std::string& component, const std::string& message, bool is_error);

  std::mutex mu_;
  std::ofstream file_;
  bool console_enabled_ = true;
};

}  // namespace autofile_core
