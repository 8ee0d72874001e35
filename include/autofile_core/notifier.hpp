#pragma once

#include <string>

namespace autofile_core {

class Logger;

// Fire-and-forget user notification.
class INotifier {
 public:
  virtual ~INotifier() = default;
  virtual void notify(const std::string& title, const std::string& message) = 0;
};

// Writes "[Notify] title: message" through the shared logger.
class ConsoleNotifier : public INotifier {
 public:
  explicit ConsoleNotifier(Logger& logger) : logger_(logger) {}
  void notify(const std::string& title, const std::string& message) override;

 private:
  Logger& logger_;
};

}  // namespace autofile_core
