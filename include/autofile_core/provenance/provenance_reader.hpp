#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "autofile_core/types/classification.hpp"

namespace autofile_core {

// Reads the download provenance tag attached to a file. Implementations return
// std::nullopt when the file carries no tag; they may throw on I/O failure.
class IProvenanceReader {
 public:
  virtual ~IProvenanceReader() = default;
  virtual std::optional<ProvenanceAttributes> read(const std::filesystem::path& path) = 0;
};

// Parses the INI-like Zone.Identifier payload ("[ZoneTransfer]\nZoneId=3\n...").
// Lines without '=' are skipped, keys and values are trimmed.
ProvenanceAttributes parse_zone_identifier(const std::string& text);

// "<file>:Zone.Identifier"
std::filesystem::path zone_identifier_path(const std::filesystem::path& path);

// Moves the Zone.Identifier sidecar of `original` (if any) to sit beside
// `moved` under the matching name. Never replaces an existing sidecar.
std::error_code relocate_zone_identifier(const std::filesystem::path& original,
                                         const std::filesystem::path& moved);

// Windows alternate data stream "<file>:Zone.Identifier". On other platforms
// this picks up the sidecar file of the same name that copies off NTFS leave.
class ZoneIdentifierReader : public IProvenanceReader {
 public:
  std::optional<ProvenanceAttributes> read(const std::filesystem::path& path) override;
};

// Browser-set extended attributes on Linux (user.xdg.referrer.url and
// user.xdg.origin.url), reported under the Zone.Identifier key names.
class XattrProvenanceReader : public IProvenanceReader {
 public:
  std::optional<ProvenanceAttributes> read(const std::filesystem::path& path) override;
};

// First reader that yields a non-empty attribute set wins.
class CompositeProvenanceReader : public IProvenanceReader {
 public:
  CompositeProvenanceReader() = default;
  explicit CompositeProvenanceReader(std::vector<std::unique_ptr<IProvenanceReader>> readers);

  void add(std::unique_ptr<IProvenanceReader> reader);
  std::optional<ProvenanceAttributes> read(const std::filesystem::path& path) override;

 private:
  std::vector<std::unique_ptr<IProvenanceReader>> readers_;
};

std::unique_ptr<IProvenanceReader> make_default_provenance_reader();

}  // namespace autofile_core
