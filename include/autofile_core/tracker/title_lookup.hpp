#pragma once

#include <string>

namespace autofile_core {

// Resolves a ticket identifier to its human title. Implementations throw
// LookupFailure for network, auth, not-found and payload errors.
class ITitleLookup {
 public:
  virtual ~ITitleLookup() = default;
  virtual std::string lookup_title(const std::string& ticket_number) = 0;
  virtual bool is_logged_in() const = 0;
};

}  // namespace autofile_core
