#include "autofile_core/processed_set.hpp"

#include <system_error>

namespace autofile_core {

std::string ProcessedSet::key_for(const std::filesystem::path& path) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(path, ec);
  if (ec) {
    return path.lexically_normal().string();
  }
  return abs.lexically_normal().string();
}

bool ProcessedSet::try_claim(const std::filesystem::path& path) {
  const std::string key = key_for(path);
  std::lock_guard<std::mutex> lk(mu_);
  if (closed_) {
    return false;
  }
  return claimed_.insert(key).second;
}

bool ProcessedSet::contains(const std::filesystem::path& path) const {
  const std::string key = key_for(path);
  std::lock_guard<std::mutex> lk(mu_);
  return claimed_.count(key) > 0;
}

std::size_t ProcessedSet::seed_from_directory(const std::filesystem::path& folder) {
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    return 0;
  }

  std::size_t added = 0;
  const auto opts = std::filesystem::directory_options::skip_permission_denied;
  for (std::filesystem::directory_iterator it(folder, opts, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (try_claim(it->path())) {
      ++added;
    }
  }
  return added;
}

void ProcessedSet::close() {
  std::lock_guard<std::mutex> lk(mu_);
  closed_ = true;
}

bool ProcessedSet::is_closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::size_t ProcessedSet::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return claimed_.size();
}

}  // namespace autofile_core
