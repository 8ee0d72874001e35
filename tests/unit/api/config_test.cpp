#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdio>
#include <vector>
#include <unistd.h>

#include "autofile_api/config.hpp"

using autofile_api::Config;

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/autofile_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"api_base_url", "0.0.0.0:8080"},
      {"journal_db_path", "./data/j.db"},
      {"num_workers", 4},
      {"watch_directory", "/home/me/Downloads"},
      {"destination_root", "/data"},
      {"trusted_host", "tracker.example.com"},
      {"tracker_url", "https://tracker.example.com"},
      {"ignore_suffixes", {".part"}},
      {"modified_delay_ms", 5000}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.host(), "0.0.0.0");
  EXPECT_EQ(cfg.port(), 8080);
  EXPECT_EQ(cfg.journal_db_path, "./data/j.db");
  EXPECT_EQ(cfg.num_workers, 4);
  EXPECT_EQ(cfg.watch_directory, "/home/me/Downloads");
  EXPECT_EQ(cfg.destination_root, "/data");
  EXPECT_EQ(cfg.trusted_host, "tracker.example.com");
  EXPECT_EQ(cfg.tracker_url, "https://tracker.example.com");
  EXPECT_THAT(cfg.ignore_suffixes, ::testing::ElementsAre(".part"));
  EXPECT_EQ(cfg.modified_delay_ms, 5000);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  nlohmann::json j = nlohmann::json::object();

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:3131");
  EXPECT_EQ(cfg.journal_db_path, "./data/journal.db");
  EXPECT_EQ(cfg.num_workers, 2);
  EXPECT_TRUE(cfg.file_watcher_enabled);
  EXPECT_TRUE(cfg.seed_existing_files);
  EXPECT_TRUE(cfg.auto_organize);
  EXPECT_EQ(cfg.settle_probe_interval_ms, 500);
  EXPECT_EQ(cfg.settle_max_attempts, 10);
  EXPECT_EQ(cfg.created_delay_ms, 2000);
  EXPECT_EQ(cfg.moved_delay_ms, 1000);
  EXPECT_EQ(cfg.modified_delay_ms, 3000);
  EXPECT_THAT(cfg.ignore_suffixes,
              ::testing::ElementsAre(".tmp", ".crdownload", ".partial", ".download"));
  EXPECT_TRUE(cfg.trusted_host.empty());
  EXPECT_TRUE(cfg.log_file.empty());
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "journal_db_path": "./db/journal.db",
    "destination_root": "/srv/filed",
    "num_workers": 3
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.port(), 4000);
  EXPECT_EQ(cfg.journal_db_path, "./db/journal.db");
  EXPECT_EQ(cfg.destination_root, "/srv/filed");
  EXPECT_EQ(cfg.num_workers, 3);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/config.json");
  }, std::runtime_error);
}

TEST(ConfigTest, MalformedJsonThrows) {
  std::string path = write_temp_file("{ not json");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, WrongValueTypeThrows) {
  nlohmann::json j = {{"num_workers", "four"}};
  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, InvalidValuesAreRejected) {
  const std::vector<nlohmann::json> invalid = {
      nlohmann::json{{"api_base_url", ""}},
      nlohmann::json{{"api_base_url", "localhost"}},
      nlohmann::json{{"api_base_url", "localhost:http"}},
      nlohmann::json{{"journal_db_path", ""}},
      nlohmann::json{{"num_workers", 0}},
      nlohmann::json{{"destination_root", ""}},
      nlohmann::json{{"file_watcher_enabled", true}, {"watch_directory", ""}},
      nlohmann::json{{"settle_probe_interval_ms", 10}},
      nlohmann::json{{"settle_max_attempts", 0}},
      nlohmann::json{{"moved_delay_ms", -1}},
      nlohmann::json{{"tracker_url", "tracker.example.com"}},
  };

  for (const auto& j : invalid) {
    EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error) << j.dump();
  }
}

TEST(ConfigTest, EmptyWatchDirectoryAllowedWhenWatcherDisabled) {
  nlohmann::json j = {{"file_watcher_enabled", false}, {"watch_directory", ""}};
  EXPECT_NO_THROW({ (void)Config::from_json(j); });
}
