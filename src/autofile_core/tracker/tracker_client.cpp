#include "autofile_core/tracker/tracker_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <nlohmann/json.hpp>

#include "autofile_core/errors.hpp"

namespace autofile_core {

constexpr std::chrono::seconds TrackerClient::kRequestTimeout;

TrackerClient::TrackerClient(std::string base_url, std::string api_key)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

size_t TrackerClient::write_callback(void* contents, size_t size, size_t nmemb,
                                     std::string* userp) {
  userp->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

std::string TrackerClient::issue_url(const std::string& ticket_number) const {
  return base_url_ + "/issues/" + ticket_number + ".json";
}

std::string TrackerClient::username() const {
  std::lock_guard<std::mutex> lk(mu_);
  return username_;
}

TrackerClient::HttpResponse TrackerClient::get(const std::string& url) const {
  std::string api_key;
  std::string username;
  std::string password;
  {
    std::lock_guard<std::mutex> lk(mu_);
    api_key = api_key_;
    username = username_;
    password = password_;
  }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    throw LookupFailure("Failed to initialize CURL");
  }

  HttpResponse response;
  struct curl_slist* headers = curl_slist_append(nullptr, "Accept: application/json");
  std::string key_header;
  if (!api_key.empty()) {
    key_header = "X-Redmine-API-Key: " + api_key;
    headers = curl_slist_append(headers, key_header.c_str());
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(kRequestTimeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  if (api_key.empty() && !username.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl.get(), CURLOPT_USERNAME, username.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, password.c_str());
  }

  CURLcode res = curl_easy_perform(curl.get());
  curl_slist_free_all(headers);
  if (res != CURLE_OK) {
    throw LookupFailure("Request to " + url + " failed: " + curl_easy_strerror(res));
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

bool TrackerClient::verify_current_user() {
  const HttpResponse response = get(base_url_ + "/users/current.json");
  bool ok = false;
  if (response.status == 200) {
    ok = true;
  } else if (response.status != 401 && response.status != 403) {
    throw LookupFailure("Login check returned HTTP status " + std::to_string(response.status));
  }
  std::lock_guard<std::mutex> lk(mu_);
  logged_in_ = ok;
  return ok;
}

bool TrackerClient::login(const std::string& username, const std::string& password) {
  if (base_url_.empty()) {
    throw LookupFailure("Tracker URL is not configured");
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    username_ = username;
    password_ = password;
    logged_in_ = false;
  }
  return verify_current_user();
}

bool TrackerClient::login_with_api_key() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (api_key_.empty()) {
      return false;
    }
  }
  if (base_url_.empty()) {
    throw LookupFailure("Tracker URL is not configured");
  }
  return verify_current_user();
}

void TrackerClient::logout() {
  std::lock_guard<std::mutex> lk(mu_);
  username_.clear();
  password_.clear();
  logged_in_ = false;
}

bool TrackerClient::is_logged_in() const {
  std::lock_guard<std::mutex> lk(mu_);
  return logged_in_;
}

std::string TrackerClient::lookup_title(const std::string& ticket_number) {
  if (!is_logged_in()) {
    throw LookupFailure("Not logged in to the tracker");
  }

  const HttpResponse response = get(issue_url(ticket_number));
  switch (response.status) {
    case 200:
      return parse_issue_subject(response.body);
    case 401:
    case 403:
      throw LookupFailure("Not authorized to read ticket #" + ticket_number);
    case 404:
      throw LookupFailure("Ticket #" + ticket_number + " not found");
    default:
      throw LookupFailure("Ticket #" + ticket_number + " lookup returned HTTP status " +
                          std::to_string(response.status));
  }
}

std::string TrackerClient::parse_issue_subject(const std::string& body) {
  try {
    const nlohmann::json j = nlohmann::json::parse(body);
    const auto& subject = j.at("issue").at("subject");
    if (!subject.is_string()) {
      throw LookupFailure("issue.subject is not a string");
    }
    return subject.get<std::string>();
  } catch (const nlohmann::json::exception& e) {
    throw LookupFailure(std::string("Malformed issue payload: ") + e.what());
  }
}

}  // namespace autofile_core
