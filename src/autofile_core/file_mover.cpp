#include "autofile_core/file_mover.hpp"

#include <unistd.h>

#include <atomic>
#include <stdexcept>

#include "autofile_core/errors.hpp"
#include "autofile_core/time_utils.hpp"

namespace autofile_core {

FileMover::FileMover(int max_attempts) : max_attempts_(max_attempts) {
  if (max_attempts_ < 1) {
    throw std::invalid_argument("FileMover needs at least one attempt");
  }
}

std::filesystem::path FileMover::candidate_path(const std::filesystem::path& target_directory,
                                                const std::filesystem::path& file_name,
                                                CollisionPolicy policy,
                                                int attempt,
                                                std::chrono::system_clock::time_point now) {
  if (attempt <= 0) {
    return target_directory / file_name;
  }

  const std::string stem = file_name.stem().string();
  const std::string ext = file_name.extension().string();
  std::string name;
  if (policy == CollisionPolicy::NumberedSuffix) {
    name = stem + "_" + std::to_string(attempt);
  } else {
    name = stem + "_" + format_local_time(now, "%Y%m%d_%H%M%S");
    if (attempt > 1) {
      name += "_" + std::to_string(attempt);
    }
  }
  return target_directory / (name + ext);
}

MovedPath FileMover::move(const std::filesystem::path& source,
                          const std::filesystem::path& target_directory,
                          CollisionPolicy policy) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    throw MoveError("Source is not a regular file: " + source.string(),
                    ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
  }

  std::filesystem::create_directories(target_directory, ec);
  if (ec) {
    throw MoveError("Failed to create directory " + target_directory.string(), ec);
  }

  const auto now = std::chrono::system_clock::now();
  const auto file_name = source.filename();

  for (int attempt = 0; attempt < max_attempts_; ++attempt) {
    const auto candidate = candidate_path(target_directory, file_name, policy, attempt, now);
    if (std::filesystem::exists(candidate, ec)) {
      continue;
    }

    ec = place_exclusive(source, candidate);
    if (ec == std::errc::file_exists) {
      continue;
    }
    if (ec) {
      throw MoveError("Failed to move " + source.string() + " to " + candidate.string(), ec);
    }

    std::error_code rm_ec;
    std::filesystem::remove(source, rm_ec);
    if (rm_ec) {
      // Undo the placement so the file exists exactly once
      std::error_code undo_ec;
      std::filesystem::remove(candidate, undo_ec);
      throw MoveError("Failed to remove source " + source.string(), rm_ec);
    }
    return candidate;
  }

  throw MoveError("No free destination name for " + file_name.string() + " in " +
                      target_directory.string() + " after " + std::to_string(max_attempts_) +
                      " attempts",
                  std::make_error_code(std::errc::file_exists));
}

namespace {

std::filesystem::path partial_path_for(const std::filesystem::path& destination) {
  static std::atomic<unsigned> sequence{0};
  return destination.parent_path() /
         ("." + destination.filename().string() + "." + std::to_string(::getpid()) + "-" +
          std::to_string(sequence.fetch_add(1)) + ".autofile-partial");
}

}  // namespace

std::error_code FileMover::place_exclusive(const std::filesystem::path& source,
                                           const std::filesystem::path& destination) {
  std::error_code ec = link_file(source, destination);
  if (!ec || ec == std::errc::file_exists) {
    return ec;
  }
  // Cross-device or no hard link support
  return copy_then_claim(source, destination);
}

std::error_code FileMover::copy_then_claim(const std::filesystem::path& source,
                                           const std::filesystem::path& destination) {
  const auto partial = partial_path_for(destination);

  std::error_code ec = copy_contents(source, partial);
  if (!ec) {
    const auto mtime = std::filesystem::last_write_time(source, ec);
    if (!ec) {
      std::filesystem::last_write_time(partial, mtime, ec);
    }
  }

  if (!ec) {
    ec = link_file(partial, destination);
    if (ec && ec != std::errc::file_exists) {
      // No hard links on this filesystem: rename unless the name was taken
      std::error_code exists_ec;
      if (std::filesystem::exists(destination, exists_ec) || exists_ec) {
        ec = exists_ec ? exists_ec : std::make_error_code(std::errc::file_exists);
      } else {
        ec.clear();
        std::filesystem::rename(partial, destination, ec);
      }
    }
  }

  std::error_code rm_ec;
  std::filesystem::remove(partial, rm_ec);
  return ec;
}

std::error_code FileMover::link_file(const std::filesystem::path& from,
                                     const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::create_hard_link(from, to, ec);
  return ec;
}

std::error_code FileMover::copy_contents(const std::filesystem::path& from,
                                         const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, ec);
  return ec;
}

}  // namespace autofile_core
