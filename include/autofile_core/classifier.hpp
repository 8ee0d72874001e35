#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "autofile_core/types/classification.hpp"

namespace autofile_core {

class IProvenanceReader;

/**
 * @class Classifier
 * @brief Labels a settled file from its download provenance.
 *
 * A file is Identified when the configured tracker host appears in either the
 * referrer or the host URL of its provenance tag. The ticket number
 * (/issues/<n>) and attachment id (/attachments/<n>) are then scraped from the
 * referrer; both are optional. Anything else, including a failing reader or
 * an empty trusted host, classifies as Unidentified.
 */
class Classifier {
 public:
  Classifier(IProvenanceReader& reader, std::string trusted_host);
  virtual ~Classifier() = default;

  virtual Classification classify(const std::filesystem::path& path) const;

  // Pure part of classify(), exposed for callers that already hold the tag.
  Classification classify_attributes(const ProvenanceAttributes& attributes) const;

  const std::string& trusted_host() const {
    return trusted_host_;
  }

 private:
  IProvenanceReader& reader_;
  std::string trusted_host_;
};

// Title grammar: "[seg1][seg2]rest" (three levels, tried first) or
// "[seg1]rest" (two levels). Segments may not contain ']', rest is trimmed.
std::optional<Labels> parse_label(const std::string& title);

}  // namespace autofile_core
