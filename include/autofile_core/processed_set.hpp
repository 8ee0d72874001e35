#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>

namespace autofile_core {

// Run-scoped record of every path already handed to the filing pipeline.
// Entries are never evicted; a restart starts from an empty set (optionally
// seeded with the watch folder listing so historic downloads stay put).
class ProcessedSet {
 public:
  ProcessedSet() = default;

  ProcessedSet(const ProcessedSet&) = delete;
  ProcessedSet& operator=(const ProcessedSet&) = delete;

  // Atomically inserts path if absent. False means already claimed, or the
  // tracker has been closed.
  bool try_claim(const std::filesystem::path& path);

  bool contains(const std::filesystem::path& path) const;

  // Claims every entry currently in folder. Returns the number added.
  std::size_t seed_from_directory(const std::filesystem::path& folder);

  // After close() all claims are refused without error.
  void close();
  bool is_closed() const;

  std::size_t size() const;

 private:
  static std::string key_for(const std::filesystem::path& path);

  mutable std::mutex mu_;
  std::unordered_set<std::string> claimed_;
  bool closed_ = false;
};

}  // namespace autofile_core
