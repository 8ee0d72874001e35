#include "autofile_core/services/download_scan_service.hpp"

#include <algorithm>

#include "autofile_core/classifier.hpp"
#include "autofile_core/path_builder.hpp"

namespace autofile_core {

DownloadScanService::DownloadScanService(std::filesystem::path watch_directory,
                                         const Classifier& classifier)
    : watch_directory_(std::move(watch_directory)), classifier_(classifier) {}

std::vector<DownloadEntry> DownloadScanService::scan() const {
  std::vector<DownloadEntry> entries;
  std::error_code ec;
  if (!std::filesystem::is_directory(watch_directory_, ec)) {
    return entries;
  }

  const auto opts = std::filesystem::directory_options::skip_permission_denied;
  for (std::filesystem::directory_iterator it(watch_directory_, opts, ec), end;
       !ec && it != end; it.increment(ec)) {
    std::error_code ec2;
    if (!it->is_regular_file(ec2)) continue;

    Classification classification = classifier_.classify(it->path());
    if (!classification.is_identified()) continue;

    DownloadEntry entry;
    entry.path = it->path();
    entry.filename = it->path().filename().string();
    entry.classification = std::move(classification);
    entry.mtime = PathBuilder::reference_time_for(it->path());
    entries.push_back(std::move(entry));
  }

  std::sort(entries.begin(), entries.end(),
            [](const DownloadEntry& a, const DownloadEntry& b) { return a.mtime > b.mtime; });
  return entries;
}

}  // namespace autofile_core
