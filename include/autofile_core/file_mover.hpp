#pragma once

#include <chrono>
#include <filesystem>
#include <system_error>

namespace autofile_core {

using MovedPath = std::filesystem::path;

enum class CollisionPolicy {
  Timestamp,       // name_YYYYMMDD_HHMMSS.ext, then name_YYYYMMDD_HHMMSS_2.ext ...
  NumberedSuffix   // name_1.ext, name_2.ext ...
};

/**
 * @class FileMover
 * @brief Collision-safe relocation of one file into a target directory.
 *
 * The destination is never overwritten: the file is placed with a hard link
 * that fails if the name exists, and only then is the source unlinked. Across
 * volumes the bytes are first copied to a hidden sibling temp file (mtime
 * carried over) which is then linked or renamed onto the free name, so a
 * failed copy never leaves a truncated file under a real name. When
 * the chosen name is taken the next candidate is tried, up to max_attempts.
 * On failure a MoveError is thrown and the source is left in place.
 */
class FileMover {
 public:
  explicit FileMover(int max_attempts = 10);
  virtual ~FileMover() = default;

  virtual MovedPath move(const std::filesystem::path& source,
                         const std::filesystem::path& target_directory,
                         CollisionPolicy policy = CollisionPolicy::Timestamp);

  // Name tried on the given attempt (0 is the unchanged file name).
  static std::filesystem::path candidate_path(const std::filesystem::path& target_directory,
                                              const std::filesystem::path& file_name,
                                              CollisionPolicy policy,
                                              int attempt,
                                              std::chrono::system_clock::time_point now);

  int max_attempts() const {
    return max_attempts_;
  }

 protected:
  // Filesystem primitives used for placement; both fail if `to` exists.
  virtual std::error_code link_file(const std::filesystem::path& from,
                                    const std::filesystem::path& to);
  virtual std::error_code copy_contents(const std::filesystem::path& from,
                                        const std::filesystem::path& to);

 private:
  // Returns errc::file_exists when the candidate was taken concurrently.
  std::error_code place_exclusive(const std::filesystem::path& source,
                                  const std::filesystem::path& destination);
  std::error_code copy_then_claim(const std::filesystem::path& source,
                                  const std::filesystem::path& destination);

  int max_attempts_;
};

}  // namespace autofile_core
