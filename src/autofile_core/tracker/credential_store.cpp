#include "autofile_core/tracker/credential_store.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <vector>

namespace autofile_core {

CredentialStore::CredentialStore(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::string CredentialStore::encode_base64(const std::string& raw) {
  if (raw.empty()) {
    return "";
  }
  std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
  const int len = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(raw.data()),
                                  static_cast<int>(raw.size()));
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
}

std::string CredentialStore::decode_base64(const std::string& encoded) {
  if (encoded.empty()) {
    return "";
  }
  if (encoded.size() % 4 != 0) {
    throw CredentialStoreError("Invalid base64 length");
  }
  std::vector<unsigned char> out(3 * (encoded.size() / 4) + 1);
  int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
  if (len < 0) {
    throw CredentialStoreError("Invalid base64 data");
  }
  // EVP_DecodeBlock counts the padding bytes as zeros
  if (encoded[encoded.size() - 1] == '=') --len;
  if (encoded[encoded.size() - 2] == '=') --len;
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
}

std::optional<Credentials> CredentialStore::load() const {
  std::error_code ec;
  if (!std::filesystem::exists(file_path_, ec)) {
    return std::nullopt;
  }

  std::ifstream file(file_path_);
  if (!file.is_open()) {
    throw CredentialStoreError("Cannot open credentials file: " + file_path_.string());
  }

  try {
    nlohmann::json j;
    file >> j;
    Credentials credentials;
    credentials.username = j.at("username").get<std::string>();
    credentials.password = decode_base64(j.at("password").get<std::string>());
    if (credentials.username.empty()) {
      return std::nullopt;
    }
    return credentials;
  } catch (const nlohmann::json::exception& e) {
    throw CredentialStoreError("Malformed credentials file " + file_path_.string() + ": " +
                               e.what());
  }
}

void CredentialStore::save(const Credentials& credentials) const {
  if (file_path_.has_parent_path()) {
    std::filesystem::create_directories(file_path_.parent_path());
  }

  nlohmann::json j = {{"username", credentials.username},
                      {"password", encode_base64(credentials.password)}};

  std::ofstream file(file_path_, std::ios::trunc);
  if (!file.is_open()) {
    throw CredentialStoreError("Cannot write credentials file: " + file_path_.string());
  }
  file << j.dump(2);
  file.close();

  std::error_code ec;
  std::filesystem::permissions(
      file_path_, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
      std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw CredentialStoreError("Cannot restrict credentials file permissions: " + ec.message());
  }
}

void CredentialStore::clear() const {
  std::error_code ec;
  std::filesystem::remove(file_path_, ec);
  if (ec) {
    throw CredentialStoreError("Cannot remove credentials file: " + ec.message());
  }
}

}  // namespace autofile_core
