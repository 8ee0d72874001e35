#include "autofile_core/classifier.hpp"

#include <regex>

#include "autofile_core/provenance/provenance_reader.hpp"

namespace autofile_core {

namespace {

const std::regex kIssuePattern(R"(/issues/(\d+))");
const std::regex kAttachmentPattern(R"(/attachments/(\d+))");
const std::regex kThreeLevelTitle(R"(^\[([^\]]+)\]\[([^\]]+)\](.+)$)");
const std::regex kTwoLevelTitle(R"(^\[([^\]]+)\](.+)$)");

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::optional<std::string> first_capture(const std::string& text, const std::regex& pattern) {
  std::smatch match;
  if (std::regex_search(text, match, pattern)) {
    return match[1].str();
  }
  return std::nullopt;
}

std::string attribute_or_empty(const ProvenanceAttributes& attributes, const std::string& key) {
  auto it = attributes.find(key);
  return it == attributes.end() ? std::string() : it->second;
}

}  // namespace

Classifier::Classifier(IProvenanceReader& reader, std::string trusted_host)
    : reader_(reader), trusted_host_(std::move(trusted_host)) {}

Classification Classifier::classify(const std::filesystem::path& path) const {
  std::optional<ProvenanceAttributes> attributes;
  try {
    attributes = reader_.read(path);
  } catch (const std::exception&) {
    return Classification::unidentified();
  }
  if (!attributes || attributes->empty()) {
    return Classification::unidentified();
  }
  return classify_attributes(*attributes);
}

Classification Classifier::classify_attributes(const ProvenanceAttributes& attributes) const {
  if (trusted_host_.empty()) {
    return Classification::unidentified();
  }

  const std::string referrer = attribute_or_empty(attributes, "ReferrerUrl");
  const std::string host_url = attribute_or_empty(attributes, "HostUrl");
  if (referrer.find(trusted_host_) == std::string::npos &&
      host_url.find(trusted_host_) == std::string::npos) {
    return Classification::unidentified();
  }

  Classification result;
  result.kind = ClassificationKind::Identified;
  result.referrer_url = referrer;
  result.host_url = host_url;
  result.zone_id = attribute_or_empty(attributes, "ZoneId");
  result.ticket_number = first_capture(referrer, kIssuePattern);
  result.attachment_id = first_capture(referrer, kAttachmentPattern);
  return result;
}

std::optional<Labels> parse_label(const std::string& title) {
  const std::string trimmed = trim(title);
  std::smatch match;

  if (std::regex_match(trimmed, match, kThreeLevelTitle)) {
    return Labels{{match[1].str(), match[2].str(), trim(match[3].str())}};
  }
  if (std::regex_match(trimmed, match, kTwoLevelTitle)) {
    return Labels{{match[1].str(), trim(match[2].str())}};
  }
  return std::nullopt;
}

}  // namespace autofile_core
