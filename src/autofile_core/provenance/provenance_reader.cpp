#include "autofile_core/provenance/provenance_reader.hpp"

#include <fstream>
#include <sstream>

#if defined(__linux__)
#include <sys/types.h>
#include <sys/xattr.h>
#endif

namespace autofile_core {

namespace {

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

#if defined(__linux__)
std::optional<std::string> read_xattr(const std::filesystem::path& path, const char* name) {
  const ssize_t len = ::getxattr(path.c_str(), name, nullptr, 0);
  if (len <= 0) {
    return std::nullopt;
  }
  std::string value(static_cast<std::size_t>(len), '\0');
  const ssize_t got = ::getxattr(path.c_str(), name, value.data(), value.size());
  if (got <= 0) {
    return std::nullopt;
  }
  value.resize(static_cast<std::size_t>(got));
  // Some writers include the trailing NUL
  while (!value.empty() && value.back() == '\0') {
    value.pop_back();
  }
  return value;
}
#endif

}  // namespace

ProvenanceAttributes parse_zone_identifier(const std::string& text) {
  ProvenanceAttributes attributes;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string key = trim(line.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    attributes[key] = trim(line.substr(eq + 1));
  }
  return attributes;
}

std::filesystem::path zone_identifier_path(const std::filesystem::path& path) {
  return std::filesystem::path(path.string() + ":Zone.Identifier");
}

std::error_code relocate_zone_identifier(const std::filesystem::path& original,
                                         const std::filesystem::path& moved) {
  const auto from = zone_identifier_path(original);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(std::filesystem::symlink_status(from, ec))) {
    return {};
  }
  const auto to = zone_identifier_path(moved);
  if (std::filesystem::exists(std::filesystem::symlink_status(to, ec))) {
    return std::make_error_code(std::errc::file_exists);
  }

  ec.clear();
  std::filesystem::rename(from, to, ec);
  if (ec == std::errc::cross_device_link) {
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, ec);
    if (!ec) {
      std::filesystem::remove(from, ec);
    }
  }
  return ec;
}

std::optional<ProvenanceAttributes> ZoneIdentifierReader::read(const std::filesystem::path& path) {
  std::ifstream stream(zone_identifier_path(path), std::ios::binary);
  if (!stream.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << stream.rdbuf();
  ProvenanceAttributes attributes = parse_zone_identifier(buffer.str());
  if (attributes.empty()) {
    return std::nullopt;
  }
  return attributes;
}

std::optional<ProvenanceAttributes> XattrProvenanceReader::read(const std::filesystem::path& path) {
#if defined(__linux__)
  ProvenanceAttributes attributes;
  if (auto referrer = read_xattr(path, "user.xdg.referrer.url")) {
    attributes["ReferrerUrl"] = *referrer;
  }
  if (auto origin = read_xattr(path, "user.xdg.origin.url")) {
    attributes["HostUrl"] = *origin;
  }
  if (attributes.empty()) {
    return std::nullopt;
  }
  return attributes;
#else
  (void)path;
  return std::nullopt;
#endif
}

CompositeProvenanceReader::CompositeProvenanceReader(
    std::vector<std::unique_ptr<IProvenanceReader>> readers)
    : readers_(std::move(readers)) {}

void CompositeProvenanceReader::add(std::unique_ptr<IProvenanceReader> reader) {
  readers_.push_back(std::move(reader));
}

std::optional<ProvenanceAttributes> CompositeProvenanceReader::read(
    const std::filesystem::path& path) {
  for (const auto& reader : readers_) {
    auto attributes = reader->read(path);
    if (attributes && !attributes->empty()) {
      return attributes;
    }
  }
  return std::nullopt;
}

std::unique_ptr<IProvenanceReader> make_default_provenance_reader() {
  auto composite = std::make_unique<CompositeProvenanceReader>();
  composite->add(std::make_unique<ZoneIdentifierReader>());
  composite->add(std::make_unique<XattrProvenanceReader>());
  return composite;
}

}  // namespace autofile_core
