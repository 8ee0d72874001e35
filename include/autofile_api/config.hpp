#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace autofile_api {

class Config {
 public:
  std::string api_base_url;
  std::string journal_db_path;
  int num_workers;

  // File watcher configuration
  std::string watch_directory;
  bool file_watcher_enabled;
  bool seed_existing_files;
  int settle_probe_interval_ms;
  int settle_max_attempts;
  int created_delay_ms;
  int moved_delay_ms;
  int modified_delay_ms;
  std::vector<std::string> ignore_suffixes;

  // Filing
  std::string destination_root;
  bool auto_organize;

  // Ticket tracker
  std::string trusted_host;
  std::string tracker_url;
  std::string tracker_api_key;
  std::string credentials_path;

  std::string log_file;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3131"));
      config.journal_db_path = json_config.value("journal_db_path", std::string("./data/journal.db"));
      config.num_workers = json_config.value("num_workers", 2);

      config.watch_directory = json_config.value("watch_directory", std::string("./data/downloads"));
      config.file_watcher_enabled = json_config.value("file_watcher_enabled", true);
      config.seed_existing_files = json_config.value("seed_existing_files", true);
      config.settle_probe_interval_ms = json_config.value("settle_probe_interval_ms", 500);
      config.settle_max_attempts = json_config.value("settle_max_attempts", 10);
      config.created_delay_ms = json_config.value("created_delay_ms", 2000);
      config.moved_delay_ms = json_config.value("moved_delay_ms", 1000);
      config.modified_delay_ms = json_config.value("modified_delay_ms", 3000);
      config.ignore_suffixes = json_config.value(
          "ignore_suffixes",
          std::vector<std::string>{".tmp", ".crdownload", ".partial", ".download"});

      config.destination_root = json_config.value("destination_root", std::string("./data/filed"));
      config.auto_organize = json_config.value("auto_organize", true);

      config.trusted_host = json_config.value("trusted_host", std::string());
      config.tracker_url = json_config.value("tracker_url", std::string());
      config.tracker_api_key = json_config.value("tracker_api_key", std::string());
      config.credentials_path =
          json_config.value("credentials_path", std::string("./data/credentials.json"));

      config.log_file = json_config.value("log_file", std::string());
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }
  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    const auto colon = api_base_url.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw std::runtime_error("api_base_url must look like host:port");
    }
    if (journal_db_path.empty()) {
      throw std::runtime_error("journal_db_path cannot be empty");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (file_watcher_enabled && watch_directory.empty()) {
      throw std::runtime_error("watch_directory cannot be empty when file_watcher_enabled is true");
    }
    if (destination_root.empty()) {
      throw std::runtime_error("destination_root cannot be empty");
    }
    if (settle_probe_interval_ms < 50) {
      throw std::runtime_error("settle_probe_interval_ms must be at least 50ms");
    }
    if (settle_max_attempts < 1) {
      throw std::runtime_error("settle_max_attempts must be at least 1");
    }
    if (created_delay_ms < 0 || moved_delay_ms < 0 || modified_delay_ms < 0) {
      throw std::runtime_error("event delays cannot be negative");
    }
    if (!tracker_url.empty() && tracker_url.rfind("http", 0) != 0) {
      throw std::runtime_error("tracker_url must start with http:// or https://");
    }
  }
};

}  // namespace autofile_api
