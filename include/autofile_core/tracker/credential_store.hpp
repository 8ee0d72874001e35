#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace autofile_core {

class CredentialStoreError : public std::exception {
 public:
  explicit CredentialStoreError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct Credentials {
  std::string username;
  std::string password;
};

// Remembered tracker login, kept in a small JSON file next to the config.
// The password is base64-obfuscated, not encrypted.
class CredentialStore {
 public:
  explicit CredentialStore(std::filesystem::path file_path);

  // nullopt when nothing is stored. Throws CredentialStoreError on a corrupt file.
  std::optional<Credentials> load() const;
  void save(const Credentials& credentials) const;
  void clear() const;

  const std::filesystem::path& file_path() const {
    return file_path_;
  }

  static std::string encode_base64(const std::string& raw);
  static std::string decode_base64(const std::string& encoded);

 private:
  std::filesystem::path file_path_;
};

}  // namespace autofile_core
