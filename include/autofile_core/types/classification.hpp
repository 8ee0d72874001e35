#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace autofile_core {

// Key/value attributes recorded by the OS or browser for a downloaded file
// (ReferrerUrl, HostUrl, ZoneId, ...).
using ProvenanceAttributes = std::map<std::string, std::string>;

enum class ClassificationKind { Identified, Unidentified };

std::string to_string(ClassificationKind kind);

struct Classification {
  ClassificationKind kind = ClassificationKind::Unidentified;
  std::optional<std::string> ticket_number;
  std::optional<std::string> attachment_id;
  std::string referrer_url;
  std::string host_url;
  std::string zone_id;

  bool is_identified() const {
    return kind == ClassificationKind::Identified;
  }

  static Classification unidentified() {
    return Classification{};
  }
};

// Folder segments parsed from a ticket title: [seg1][seg2]rest or [seg1]rest.
struct Labels {
  std::vector<std::string> segments;

  int levels() const {
    return static_cast<int>(segments.size());
  }

  bool operator==(const Labels& other) const {
    return segments == other.segments;
  }
};

}  // namespace autofile_core
