#pragma once
#include <filesystem>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace autofile_core {
class OrganizerService;
class DownloadScanService;
class FolderBrowser;
class MoveJournalRepo;
class TrackerClient;
class CredentialStore;
class AutofileError;
class Logger;
namespace async {
class FileWatcherService;
}
}  // namespace autofile_core

namespace autofile_api {

// Everything the handlers operate on. Owned by main(), outlives the server.
struct RouteContext {
  autofile_core::OrganizerService &organizer;
  autofile_core::async::FileWatcherService &watcher;
  autofile_core::DownloadScanService &scanner;
  autofile_core::FolderBrowser &folders;
  autofile_core::MoveJournalRepo &journal;
  autofile_core::TrackerClient &tracker;
  autofile_core::CredentialStore &credentials;
  autofile_core::Logger &logger;
  std::filesystem::path default_watch_directory;
};

class Routes {
 public:
  explicit Routes(RouteContext context);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers (public so tests can call them without a socket)
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_status(const crow::request &req);
  crow::response handle_watch_start(const crow::request &req);
  crow::response handle_watch_stop(const crow::request &req);
  crow::response handle_auto_organize(const crow::request &req);
  crow::response handle_login(const crow::request &req);
  crow::response handle_list_downloads(const crow::request &req);
  crow::response handle_preview(const crow::request &req);
  crow::response handle_process(const crow::request &req);
  crow::response handle_organize_all(const crow::request &req);
  crow::response handle_move_to_folder(const crow::request &req);
  crow::response handle_list_folders(const crow::request &req);
  crow::response handle_create_folder(const crow::request &req);
  crow::response handle_list_journal(const crow::request &req);
  crow::response handle_clear_journal(const crow::request &req);

 private:
  RouteContext ctx_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::string require_string(const nlohmann::json &body, const std::string &key);
  std::filesystem::path current_watch_directory() const;
  // `file_path` must name a regular file directly inside the watch directory
  std::filesystem::path require_download(const nlohmann::json &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_pipeline_error_response(const autofile_core::AutofileError &e);
};

}  // namespace autofile_api
