#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "autofile_api/routes.hpp"
#include "autofile_core/async/event_debouncer.hpp"
#include "autofile_core/async/file_watcher_service.hpp"
#include "autofile_core/async/service_provider.hpp"
#include "autofile_core/async/task_queue.hpp"
#include "autofile_core/async/timer_scheduler.hpp"
#include "autofile_core/classifier.hpp"
#include "autofile_core/errors.hpp"
#include "autofile_core/processed_set.hpp"
#include "autofile_core/services/download_scan_service.hpp"
#include "autofile_core/services/folder_browser.hpp"
#include "autofile_core/services/organizer_service.hpp"
#include "autofile_core/settle_detector.hpp"
#include "autofile_core/tracker/credential_store.hpp"
#include "autofile_core/tracker/tracker_client.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace autofile_tests {

using namespace autofile_core;
using namespace autofile_core::async;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

// Drives the handlers directly, no socket involved
class RoutesTest : public JournalTestBase {
 protected:
  void SetUp() override {
    JournalTestBase::SetUp();
    downloads_ = temp_dir_ / "downloads";
    data_root_ = temp_dir_ / "data";
    std::filesystem::create_directories(downloads_);
    std::filesystem::create_directories(data_root_);
    ON_CALL(reader_, read(_)).WillByDefault(Return(std::nullopt));

    OrganizerConfig cfg;
    cfg.destination_root = data_root_;
    cfg.batch_pause = std::chrono::milliseconds(0);
    organizer_ = std::make_unique<OrganizerService>(cfg, classifier_, title_lookup_, mover_,
                                                    notifier_, logger_, journal_.get());
    scanner_ = std::make_unique<DownloadScanService>(downloads_, classifier_);
    folders_ = std::make_unique<FolderBrowser>(data_root_);
    credentials_ = std::make_unique<CredentialStore>(temp_dir_ / "credentials.json");

    debouncer_ = std::make_unique<EventDebouncer>(DebounceConfig{}, scheduler_, services_);
    watcher_ = std::make_unique<FileWatcherService>(
        WatchConfig{}, *debouncer_, services_,
        [](const std::filesystem::path&, IFileWatcherBackend::Handler handler)
            -> std::unique_ptr<IFileWatcherBackend> {
          auto backend = std::make_unique<NiceMock<MockFileWatcherBackend>>();
          backend->set_handler(std::move(handler));
          return backend;
        });

    routes_ = std::make_unique<autofile_api::Routes>(autofile_api::RouteContext{
        *organizer_, *watcher_, *scanner_, *folders_, *journal_, tracker_, *credentials_,
        logger_, downloads_});
  }

  void TearDown() override {
    routes_.reset();
    watcher_.reset();
    debouncer_.reset();
    organizer_.reset();
    JournalTestBase::TearDown();
  }

  static crow::request post(const std::string& body) {
    crow::request req;
    req.method = crow::HTTPMethod::POST;
    req.body = body;
    return req;
  }

  static crow::request get(const std::string& url) {
    crow::request req;
    req.method = crow::HTTPMethod::GET;
    req.url_params = crow::query_string(url);
    return req;
  }

  static nlohmann::json body_of(const crow::response& res) {
    return nlohmann::json::parse(res.body);
  }

  std::filesystem::path make_ticket_download(const std::string& name, const std::string& ticket) {
    auto path = downloads_ / name;
    TestUtilities::write_file(path, name);
    TestUtilities::set_mtime(path, TestUtilities::make_local_time(2024, 3, 5));
    ON_CALL(reader_, read(path))
        .WillByDefault(Return(MockUtilities::tracker_attributes(
            "https://tracker.example.com/issues/" + ticket)));
    return path;
  }

  std::filesystem::path downloads_;
  std::filesystem::path data_root_;

  NiceMock<MockProvenanceReader> reader_;
  Classifier classifier_{reader_, "tracker.example.com"};
  NiceMock<MockTitleLookup> title_lookup_;
  NiceMock<MockFileMover> mover_;
  NiceMock<MockNotifier> notifier_;
  TrackerClient tracker_{"https://tracker.example.com"};

  SettleDetector settle_;
  ProcessedSet processed_;
  ServiceProvider services_{settle_, processed_, logger_};
  TaskQueue queue_;
  TimerScheduler scheduler_{queue_};

  std::unique_ptr<OrganizerService> organizer_;
  std::unique_ptr<DownloadScanService> scanner_;
  std::unique_ptr<FolderBrowser> folders_;
  std::unique_ptr<CredentialStore> credentials_;
  std::unique_ptr<EventDebouncer> debouncer_;
  std::unique_ptr<FileWatcherService> watcher_;
  std::unique_ptr<autofile_api::Routes> routes_;
};

TEST_F(RoutesTest, HealthCheckIsSuccessful) {
  auto res = routes_->handle_health_check(crow::request{});
  EXPECT_EQ(res.code, 200);
  auto json = body_of(res);
  EXPECT_TRUE(json["success"].get<bool>());
  EXPECT_EQ(json["status"], "healthy");
}

TEST_F(RoutesTest, StatusReportsIdleWatcher) {
  auto res = routes_->handle_status(crow::request{});
  ASSERT_EQ(res.code, 200);
  auto data = body_of(res)["data"];
  EXPECT_FALSE(data["watching"].get<bool>());
  EXPECT_EQ(data["watch_directory"], downloads_.string());
  EXPECT_TRUE(data["auto_organize"].get<bool>());
  EXPECT_FALSE(data["logged_in"].get<bool>());
  EXPECT_EQ(data["stats"]["events_seen"], 0);
}

TEST_F(RoutesTest, WatchStartAndStop) {
  auto res = routes_->handle_watch_start(post(""));
  ASSERT_EQ(res.code, 200);
  EXPECT_TRUE(watcher_->is_running());

  res = routes_->handle_watch_stop(post(""));
  EXPECT_EQ(res.code, 200);
  EXPECT_FALSE(watcher_->is_running());
}

TEST_F(RoutesTest, WatchStartOnMissingFolderFails) {
  auto res = routes_->handle_watch_start(
      post(nlohmann::json{{"folder", (temp_dir_ / "missing").string()}}.dump()));
  EXPECT_EQ(res.code, 500);
  EXPECT_FALSE(body_of(res)["success"].get<bool>());
}

TEST_F(RoutesTest, AutoOrganizeToggle) {
  auto res = routes_->handle_auto_organize(post(R"({"enabled": false})"));
  ASSERT_EQ(res.code, 200);
  EXPECT_FALSE(organizer_->auto_organize_enabled());

  res = routes_->handle_auto_organize(post(R"({"enabled": "yes"})"));
  EXPECT_EQ(res.code, 400);
}

TEST_F(RoutesTest, InvalidJsonIsBadRequest) {
  auto res = routes_->handle_process(post("{not json"));
  EXPECT_EQ(res.code, 400);
  EXPECT_NE(body_of(res)["error"].get<std::string>().find("Invalid JSON"), std::string::npos);
}

TEST_F(RoutesTest, LoginRequiresCredentials) {
  auto res = routes_->handle_login(post(R"({"username": "alice"})"));
  EXPECT_EQ(res.code, 400);
}

TEST_F(RoutesTest, ListDownloadsShowsIdentifiedFiles) {
  make_ticket_download("report.pdf", "4521");
  TestUtilities::write_file(downloads_ / "other.iso", "x");

  auto res = routes_->handle_list_downloads(crow::request{});
  ASSERT_EQ(res.code, 200);
  auto files = body_of(res)["files"];
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0]["filename"], "report.pdf");
  EXPECT_EQ(files[0]["ticket_number"], "4521");
  EXPECT_TRUE(files[0]["attachment_id"].is_null());
}

TEST_F(RoutesTest, PreviewReturnsPlannedFolder) {
  auto path = make_ticket_download("report.pdf", "1");
  auto res = routes_->handle_preview(post(
      nlohmann::json{{"file_path", path.string()}, {"title", "[Acme]Door"}}.dump()));
  ASSERT_EQ(res.code, 200);
  auto data = body_of(res)["data"];
  EXPECT_EQ(data["target_directory"], (data_root_ / "Acme" / "Door" / "20240305").string());
  EXPECT_EQ(data["levels"], 2);
}

TEST_F(RoutesTest, PreviewWithUnrecognizedTitleIsUnprocessable) {
  auto path = make_ticket_download("report.pdf", "1");
  auto res = routes_->handle_preview(
      post(nlohmann::json{{"file_path", path.string()}, {"title", "plain"}}.dump()));
  EXPECT_EQ(res.code, 422);
  EXPECT_EQ(body_of(res)["error_kind"], "UNRECOGNIZED_LABEL");
}

TEST_F(RoutesTest, ProcessWithTitleMovesFile) {
  auto path = make_ticket_download("report.pdf", "1");
  auto res = routes_->handle_process(
      post(nlohmann::json{{"file_path", path.string()}, {"title", "[Acme][P1]Door"}}.dump()));
  ASSERT_EQ(res.code, 200);
  auto dest = body_of(res)["data"]["destination"].get<std::string>();
  EXPECT_EQ(dest, (data_root_ / "Acme" / "P1" / "Door" / "20240305" / "report.pdf").string());
  EXPECT_TRUE(std::filesystem::exists(dest));
}

TEST_F(RoutesTest, ProcessUnidentifiedFileIsUnprocessable) {
  auto path = downloads_ / "stray.bin";
  TestUtilities::write_file(path, "x");
  auto res = routes_->handle_process(post(nlohmann::json{{"file_path", path.string()}}.dump()));
  EXPECT_EQ(res.code, 422);
  EXPECT_EQ(body_of(res)["error_kind"], "NOT_IDENTIFIED");
}

TEST_F(RoutesTest, OrganizeAllReportsCounts) {
  make_ticket_download("a.pdf", "1");
  EXPECT_CALL(title_lookup_, lookup_title("1")).WillOnce(Return("[Acme]Door"));

  auto res = routes_->handle_organize_all(post(""));
  ASSERT_EQ(res.code, 200);
  auto data = body_of(res)["data"];
  EXPECT_EQ(data["succeeded"], 1);
  EXPECT_EQ(data["failed"], 0);
  EXPECT_EQ(data["last_folder"], (data_root_ / "Acme" / "Door" / "20240305").string());
}

TEST_F(RoutesTest, OrganizeAllWhileLoggedOutIsBadGateway) {
  EXPECT_CALL(title_lookup_, is_logged_in()).WillRepeatedly(Return(false));
  auto res = routes_->handle_organize_all(post(""));
  EXPECT_EQ(res.code, 502);
}

TEST_F(RoutesTest, MoveToFolderStaysInsideRoot) {
  auto path = downloads_ / "a.pdf";
  TestUtilities::write_file(path, "a");

  auto res = routes_->handle_move_to_folder(
      post(nlohmann::json{{"file_path", path.string()}, {"folder", "../outside"}}.dump()));
  EXPECT_EQ(res.code, 400);
  EXPECT_TRUE(std::filesystem::exists(path));

  res = routes_->handle_move_to_folder(
      post(nlohmann::json{{"file_path", path.string()}, {"folder", "Manual"}}.dump()));
  ASSERT_EQ(res.code, 200);
  EXPECT_TRUE(std::filesystem::exists(data_root_ / "Manual" / "a.pdf"));
}

TEST_F(RoutesTest, MoveOfMissingFileIsBadRequest) {
  auto res = routes_->handle_move_to_folder(post(
      nlohmann::json{{"file_path", (downloads_ / "gone.pdf").string()}, {"folder", "x"}}.dump()));
  EXPECT_EQ(res.code, 400);
  EXPECT_FALSE(body_of(res)["success"].get<bool>());
}

TEST_F(RoutesTest, FailedMoveIsConflict) {
  auto path = downloads_ / "a.pdf";
  TestUtilities::write_file(path, "a");
  EXPECT_CALL(mover_, move(path, _, _))
      .WillOnce(Throw(MoveError("Failed to move", std::make_error_code(std::errc::file_exists))));

  auto res = routes_->handle_move_to_folder(
      post(nlohmann::json{{"file_path", path.string()}, {"folder", "Manual"}}.dump()));
  EXPECT_EQ(res.code, 409);
  EXPECT_EQ(body_of(res)["error_kind"], "MOVE_ERROR");
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(RoutesTest, ManualFlowsRejectFilesOutsideWatchDirectory) {
  const auto elsewhere = temp_dir_ / "elsewhere";
  std::filesystem::create_directories(elsewhere);
  auto outside = elsewhere / "secret.pdf";
  TestUtilities::write_file(outside, "secret");
  ON_CALL(reader_, read(outside))
      .WillByDefault(
          Return(MockUtilities::tracker_attributes("https://tracker.example.com/issues/1")));
  EXPECT_CALL(mover_, move(_, _, _)).Times(0);

  auto res = routes_->handle_process(
      post(nlohmann::json{{"file_path", outside.string()}, {"title", "[Acme]Door"}}.dump()));
  EXPECT_EQ(res.code, 400);

  res = routes_->handle_move_to_folder(
      post(nlohmann::json{{"file_path", outside.string()}, {"folder", "Manual"}}.dump()));
  EXPECT_EQ(res.code, 400);

  res = routes_->handle_preview(
      post(nlohmann::json{{"file_path", outside.string()}, {"title", "[Acme]Door"}}.dump()));
  EXPECT_EQ(res.code, 400);

  // Escaping through ".." is caught after normalization
  const auto dotted = downloads_ / ".." / "elsewhere" / "secret.pdf";
  res = routes_->handle_move_to_folder(
      post(nlohmann::json{{"file_path", dotted.string()}, {"folder", "Manual"}}.dump()));
  EXPECT_EQ(res.code, 400);

  EXPECT_EQ(TestUtilities::read_file(outside), "secret");
  EXPECT_TRUE(std::filesystem::is_empty(data_root_));
}

TEST_F(RoutesTest, ManualFlowsRejectSymlinksAndSubdirectories) {
  const auto elsewhere = temp_dir_ / "elsewhere";
  std::filesystem::create_directories(elsewhere);
  TestUtilities::write_file(elsewhere / "secret.pdf", "secret");
  std::filesystem::create_symlink(elsewhere / "secret.pdf", downloads_ / "link.pdf");
  std::filesystem::create_directories(downloads_ / "nested");
  TestUtilities::write_file(downloads_ / "nested" / "deep.pdf", "deep");
  EXPECT_CALL(mover_, move(_, _, _)).Times(0);

  auto res = routes_->handle_move_to_folder(post(
      nlohmann::json{{"file_path", (downloads_ / "link.pdf").string()}, {"folder", "Manual"}}
          .dump()));
  EXPECT_EQ(res.code, 400);

  res = routes_->handle_move_to_folder(post(
      nlohmann::json{{"file_path", (downloads_ / "nested" / "deep.pdf").string()},
                     {"folder", "Manual"}}
          .dump()));
  EXPECT_EQ(res.code, 400);

  res = routes_->handle_move_to_folder(
      post(nlohmann::json{{"file_path", (downloads_ / "nested").string()}, {"folder", "Manual"}}
               .dump()));
  EXPECT_EQ(res.code, 400);

  EXPECT_TRUE(std::filesystem::exists(elsewhere / "secret.pdf"));
  EXPECT_TRUE(std::filesystem::exists(downloads_ / "nested" / "deep.pdf"));
}

TEST_F(RoutesTest, RelativeFilePathResolvesAgainstWatchDirectory) {
  TestUtilities::write_file(downloads_ / "a.pdf", "a");

  auto res = routes_->handle_move_to_folder(
      post(nlohmann::json{{"file_path", "a.pdf"}, {"folder", "Manual"}}.dump()));
  ASSERT_EQ(res.code, 200);
  EXPECT_TRUE(std::filesystem::exists(data_root_ / "Manual" / "a.pdf"));
  EXPECT_FALSE(std::filesystem::exists(downloads_ / "a.pdf"));
}

TEST_F(RoutesTest, CreateAndListFolders) {
  auto res = routes_->handle_create_folder(post(R"({"name": "Acme"})"));
  ASSERT_EQ(res.code, 200);
  res = routes_->handle_create_folder(post(R"({"name": "P100", "path": "Acme"})"));
  ASSERT_EQ(res.code, 200);

  res = routes_->handle_list_folders(get("/folders?path=Acme"));
  ASSERT_EQ(res.code, 200);
  auto folders = body_of(res)["folders"];
  ASSERT_EQ(folders.size(), 1u);
  EXPECT_EQ(folders[0], "P100");

  res = routes_->handle_list_folders(get("/folders?path=missing"));
  EXPECT_EQ(res.code, 400);
}

TEST_F(RoutesTest, JournalListsAndFiltersByStatus) {
  auto path = make_ticket_download("report.pdf", "1");
  auto stray = downloads_ / "stray.bin";
  TestUtilities::write_file(stray, "x");
  routes_->handle_process(
      post(nlohmann::json{{"file_path", path.string()}, {"title", "[Acme]Door"}}.dump()));
  auto failed = routes_->handle_process(post(nlohmann::json{{"file_path", stray.string()}}.dump()));
  ASSERT_EQ(failed.code, 422);

  auto res = routes_->handle_list_journal(get("/journal"));
  ASSERT_EQ(res.code, 200);
  EXPECT_EQ(body_of(res)["entries"].size(), 2u);

  res = routes_->handle_list_journal(get("/journal?status=MOVED&limit=10"));
  ASSERT_EQ(res.code, 200);
  auto entries = body_of(res)["entries"];
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0]["title"], "[Acme]Door");

  res = routes_->handle_list_journal(get("/journal?status=BOGUS"));
  EXPECT_EQ(res.code, 400);
}

TEST_F(RoutesTest, ClearJournalRemovesOldEntries) {
  PipelineResult result;
  result.source = downloads_ / "old.pdf";
  result.status = PipelineStatus::Moved;
  const auto id = journal_->record(result);
  backdate_entry(id, std::chrono::hours(24 * 40));

  auto res = routes_->handle_clear_journal(post(R"({"older_than_days": 30})"));
  ASSERT_EQ(res.code, 200);
  EXPECT_EQ(body_of(res)["data"]["removed"], 1);
}

}  // namespace autofile_tests
