#include "autofile_core/services/folder_browser.hpp"

#include <algorithm>
#include <cctype>

namespace autofile_core {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

FolderBrowser::FolderBrowser(std::filesystem::path destination_root) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(destination_root, ec);
  root_ = (ec ? destination_root : abs).lexically_normal();
  if (!root_.has_filename() && root_.has_relative_path()) {
    root_ = root_.parent_path();
  }
}

std::filesystem::path FolderBrowser::resolve(const std::string& relative) const {
  const std::filesystem::path rel(relative);
  if (rel.is_absolute()) {
    throw FolderBrowserError("Folder must be relative to the destination root: " + relative);
  }
  auto candidate = (root_ / rel).lexically_normal();
  if (!candidate.has_filename() && candidate.has_relative_path()) {
    candidate = candidate.parent_path();
  }
  const auto back = candidate.lexically_relative(root_);
  if (back.empty() || *back.begin() == "..") {
    throw FolderBrowserError("Folder is outside the destination root: " + relative);
  }
  return candidate;
}

std::vector<std::string> FolderBrowser::list_subfolders(const std::string& relative) const {
  const auto folder = resolve(relative);
  std::vector<std::string> names;

  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    throw FolderBrowserError("Not a folder: " + folder.string());
  }

  const auto opts = std::filesystem::directory_options::skip_permission_denied;
  for (std::filesystem::directory_iterator it(folder, opts, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code ec2;
    if (!it->is_directory(ec2)) continue;
    const std::string name = it->path().filename().string();
    if (name.empty() || name[0] == '.') continue;
    names.push_back(name);
  }
  if (ec) {
    throw FolderBrowserError("Cannot list " + folder.string() + ": " + ec.message());
  }

  std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
    return to_lower(a) < to_lower(b);
  });
  return names;
}

std::filesystem::path FolderBrowser::create_subfolder(const std::string& relative_parent,
                                                      const std::string& name) const {
  const std::string clean = sanitize_folder_name(name);
  if (clean.empty() || clean == "." || clean == "..") {
    throw FolderBrowserError("Invalid folder name: " + name);
  }

  const auto folder = resolve(relative_parent) / clean;
  std::error_code ec;
  std::filesystem::create_directories(folder, ec);
  if (ec) {
    throw FolderBrowserError("Failed to create folder " + folder.string() + ": " + ec.message());
  }
  return folder;
}

std::string FolderBrowser::sanitize_folder_name(const std::string& name) {
  static const std::string kReserved = "<>:\"/\\|?*";
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    if (kReserved.find(c) == std::string::npos) {
      out.push_back(c);
    }
  }
  const auto first = out.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = out.find_last_not_of(" \t\r\n");
  return out.substr(first, last - first + 1);
}

}  // namespace autofile_core
