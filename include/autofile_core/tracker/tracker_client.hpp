#pragma once

#include <chrono>
#include <mutex>
#include <string>

#include "autofile_core/tracker/title_lookup.hpp"

namespace autofile_core {

/**
 * @class TrackerClient
 * @brief Ticket title lookup against the tracker's JSON REST API.
 *
 * Requests go to {base_url}/issues/{n}.json and authenticate either with an
 * API key header or with the username/password given to login(). Each request
 * uses its own curl handle, so lookups may run from several workers at once.
 */
class TrackerClient : public ITitleLookup {
 public:
  explicit TrackerClient(std::string base_url, std::string api_key = "");
  ~TrackerClient() override = default;

  TrackerClient(const TrackerClient&) = delete;
  TrackerClient& operator=(const TrackerClient&) = delete;

  /**
   * @brief Verifies the credentials against /users/current.json.
   * @return true when the tracker accepted them; false on 401/403.
   * @throws LookupFailure for network errors or unexpected responses.
   */
  bool login(const std::string& username, const std::string& password);

  // Same check using the configured API key.
  bool login_with_api_key();

  void logout();

  std::string lookup_title(const std::string& ticket_number) override;
  bool is_logged_in() const override;

  const std::string& base_url() const {
    return base_url_;
  }
  std::string username() const;

  // Extracts issue.subject from an /issues/{n}.json body.
  static std::string parse_issue_subject(const std::string& body);
  std::string issue_url(const std::string& ticket_number) const;

 private:
  struct HttpResponse {
    long status = 0;
    std::string body;
  };

  HttpResponse get(const std::string& url) const;
  bool verify_current_user();
  static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);

  std::string base_url_;

  mutable std::mutex mu_;
  std::string api_key_;
  std::string username_;
  std::string password_;
  bool logged_in_ = false;

  static constexpr std::chrono::seconds kRequestTimeout{15};
};

}  // namespace autofile_core
