#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace autofile_core {

class FolderBrowserError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @class FolderBrowser
 * @brief Navigation of the destination tree for manual filing.
 *
 * Paths are given relative to the destination root and may not escape it.
 */
class FolderBrowser {
 public:
  explicit FolderBrowser(std::filesystem::path destination_root);

  // Sub-folder names of root/relative, hidden ones excluded, sorted
  // case-insensitively.
  std::vector<std::string> list_subfolders(const std::string& relative = "") const;

  // Creates root/relative_parent/<sanitized name> (no error if it exists).
  std::filesystem::path create_subfolder(const std::string& relative_parent,
                                         const std::string& name) const;

  // Absolute path for relative, throws FolderBrowserError if it leaves the root.
  std::filesystem::path resolve(const std::string& relative) const;

  // Drops <>:"/\|?* and trims surrounding whitespace.
  static std::string sanitize_folder_name(const std::string& name);

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

}  // namespace autofile_core
