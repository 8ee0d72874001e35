#include "autofile_core/notifier.hpp"

#include "autofile_core/logger.hpp"

namespace autofile_core {

void ConsoleNotifier::notify(const std::string& title, const std::string& message) {
  logger_.info("Notify", title + ": " + message);
}

}  // namespace autofile_core
