#include "autofile_api/routes.hpp"

#include <nlohmann/json.hpp>

#include "autofile_core/async/file_watcher_service.hpp"
#include "autofile_core/classifier.hpp"
#include "autofile_core/db/move_journal_repo.hpp"
#include "autofile_core/errors.hpp"
#include "autofile_core/logger.hpp"
#include "autofile_core/services/download_scan_service.hpp"
#include "autofile_core/services/folder_browser.hpp"
#include "autofile_core/services/organizer_service.hpp"
#include "autofile_core/time_utils.hpp"
#include "autofile_core/tracker/credential_store.hpp"
#include "autofile_core/tracker/tracker_client.hpp"

namespace autofile_api {

namespace {

nlohmann::json result_to_json(const autofile_core::PipelineResult &result) {
  nlohmann::json j;
  j["source"] = result.source.string();
  j["status"] = autofile_core::to_string(result.status);
  j["error_kind"] = autofile_core::to_string(result.error_kind);
  j["message"] = result.message;
  j["destination"] = result.destination ? nlohmann::json(result.destination->string())
                                        : nlohmann::json(nullptr);
  j["ticket_number"] =
      result.ticket_number ? nlohmann::json(*result.ticket_number) : nlohmann::json(nullptr);
  j["title"] = result.title ? nlohmann::json(*result.title) : nlohmann::json(nullptr);
  return j;
}

}  // namespace

Routes::Routes(RouteContext context) : ctx_(std::move(context)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/status")
  ([this](const crow::request &req) { return handle_status(req); });

  CROW_ROUTE(app, "/watch/start").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_watch_start(req);
  });

  CROW_ROUTE(app, "/watch/stop").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_watch_stop(req);
  });

  CROW_ROUTE(app, "/auto_organize")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_auto_organize(req); });

  CROW_ROUTE(app, "/login").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_login(req);
  });

  CROW_ROUTE(app, "/downloads")
  ([this](const crow::request &req) { return handle_list_downloads(req); });

  CROW_ROUTE(app, "/preview").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_preview(req);
  });

  CROW_ROUTE(app, "/process").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_process(req);
  });

  CROW_ROUTE(app, "/organize_all")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_organize_all(req); });

  CROW_ROUTE(app, "/move_to_folder")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_move_to_folder(req); });

  CROW_ROUTE(app, "/folders")
      .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST)([this](const crow::request &req) {
        if (req.method == crow::HTTPMethod::POST) {
          return handle_create_folder(req);
        }
        return handle_list_folders(req);
      });

  CROW_ROUTE(app, "/journal")
  ([this](const crow::request &req) { return handle_list_journal(req); });

  CROW_ROUTE(app, "/journal/clear")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_clear_journal(req); });

  ctx_.logger.info("API", "All routes registered successfully");
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response = create_success_response("Autofile API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_status(const crow::request &) {
  const auto stats = ctx_.watcher.stats();
  nlohmann::json data;
  data["watching"] = ctx_.watcher.is_running();
  data["watch_directory"] = current_watch_directory().string();
  data["auto_organize"] = ctx_.organizer.auto_organize_enabled();
  data["logged_in"] = ctx_.tracker.is_logged_in();
  data["username"] = ctx_.tracker.username();
  data["destination_root"] = ctx_.organizer.destination_root().string();
  data["stats"] = {{"events_seen", stats.events_seen},
                   {"events_ignored", stats.events_ignored},
                   {"checks_scheduled", stats.checks_scheduled},
                   {"arrivals_dispatched", stats.arrivals_dispatched},
                   {"settle_timeouts", stats.settle_timeouts},
                   {"claim_conflicts", stats.claim_conflicts},
                   {"overflows", stats.overflows},
                   {"files_seeded", stats.files_seeded}};
  return create_json_response(create_success_response("Status retrieved", data));
}

crow::response Routes::handle_watch_start(const crow::request &req) {
  try {
    std::filesystem::path folder = ctx_.default_watch_directory;
    if (!req.body.empty()) {
      auto body = parse_json_body(req.body);
      if (body.contains("folder") && body["folder"].is_string()) {
        folder = body["folder"].get<std::string>();
      }
    }
    ctx_.watcher.start_watching(folder);
    return create_json_response(
        create_success_response("Watching started", {{"folder", folder.string()}}));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    ctx_.logger.error("API", std::string("watch/start failed: ") + e.what());
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_watch_stop(const crow::request &) {
  ctx_.watcher.stop_watching();
  return create_json_response(create_success_response("Watching stopped"));
}

crow::response Routes::handle_auto_organize(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    if (!body.contains("enabled") || !body["enabled"].is_boolean()) {
      return create_json_response(create_error_response("Missing boolean 'enabled'"), 400);
    }
    const bool enabled = body["enabled"].get<bool>();
    ctx_.organizer.set_auto_organize(enabled);
    return create_json_response(create_success_response(
        enabled ? "Auto-organize enabled" : "Auto-organize disabled", {{"enabled", enabled}}));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }
}

crow::response Routes::handle_login(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const std::string username = require_string(body, "username");
    const std::string password = require_string(body, "password");
    const bool remember = body.value("remember", true);

    if (!ctx_.tracker.login(username, password)) {
      return create_json_response(create_error_response("Login rejected by the tracker"), 401);
    }
    if (remember) {
      ctx_.credentials.save({username, password});
    }
    ctx_.logger.info("API", "Logged in to the tracker as " + username);
    return create_json_response(create_success_response("Logged in", {{"username", username}}));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const autofile_core::AutofileError &e) {
    return create_pipeline_error_response(e);
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_downloads(const crow::request &) {
  try {
    nlohmann::json files = nlohmann::json::array();
    for (const auto &entry : ctx_.scanner.scan()) {
      const auto &c = entry.classification;
      files.push_back(
          {{"path", entry.path.string()},
           {"filename", entry.filename},
           {"ticket_number", c.ticket_number ? nlohmann::json(*c.ticket_number) : nlohmann::json(nullptr)},
           {"attachment_id", c.attachment_id ? nlohmann::json(*c.attachment_id) : nlohmann::json(nullptr)},
           {"referrer_url", c.referrer_url},
           {"mtime", autofile_core::format_local_time(entry.mtime, "%Y-%m-%d %H:%M:%S")}});
    }
    nlohmann::json response = create_success_response("Downloads scanned");
    response["files"] = files;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_preview(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const auto file_path = require_download(body);
    const std::string title = require_string(body, "title");
    const auto plan = ctx_.organizer.preview(file_path, title);
    return create_json_response(create_success_response(
        "Preview ready",
        {{"target_directory", plan.target_directory.string()}, {"levels", plan.levels}}));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const autofile_core::AutofileError &e) {
    return create_pipeline_error_response(e);
  }
}

crow::response Routes::handle_process(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const auto file_path = require_download(body);
    std::optional<std::string> title;
    if (body.contains("title") && body["title"].is_string() &&
        !body["title"].get<std::string>().empty()) {
      title = body["title"].get<std::string>();
    }
    const auto destination = ctx_.organizer.process_one(file_path, title);
    return create_json_response(
        create_success_response("File organized", {{"destination", destination.string()}}));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const autofile_core::AutofileError &e) {
    return create_pipeline_error_response(e);
  } catch (const std::exception &e) {
    ctx_.logger.error("API", std::string("process failed: ") + e.what());
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_organize_all(const crow::request &) {
  try {
    const auto batch = ctx_.organizer.organize_all(ctx_.scanner.scan());
    nlohmann::json results = nlohmann::json::array();
    for (const auto &r : batch.results) {
      results.push_back(result_to_json(r));
    }
    nlohmann::json data = {
        {"succeeded", batch.succeeded},
        {"failed", batch.failed},
        {"skipped", batch.skipped},
        {"last_folder",
         batch.last_folder ? nlohmann::json(batch.last_folder->string()) : nlohmann::json(nullptr)},
        {"results", results}};
    return create_json_response(create_success_response("Batch finished", data));
  } catch (const autofile_core::AutofileError &e) {
    return create_pipeline_error_response(e);
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_move_to_folder(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const auto file_path = require_download(body);
    const std::string folder = body.value("folder", std::string());
    const auto target = ctx_.folders.resolve(folder);
    const auto destination = ctx_.organizer.move_to_folder(file_path, target);
    return create_json_response(
        create_success_response("File moved", {{"destination", destination.string()}}));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const autofile_core::FolderBrowserError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const autofile_core::AutofileError &e) {
    return create_pipeline_error_response(e);
  }
}

crow::response Routes::handle_list_folders(const crow::request &req) {
  try {
    const char *path = req.url_params.get("path");
    const std::string relative = path ? path : "";
    nlohmann::json response = create_success_response("Folders listed");
    response["path"] = ctx_.folders.resolve(relative).string();
    response["folders"] = ctx_.folders.list_subfolders(relative);
    return create_json_response(response);
  } catch (const autofile_core::FolderBrowserError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }
}

crow::response Routes::handle_create_folder(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const std::string name = require_string(body, "name");
    const std::string parent = body.value("path", std::string());
    const auto created = ctx_.folders.create_subfolder(parent, name);
    return create_json_response(
        create_success_response("Folder created", {{"path", created.string()}}));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const autofile_core::FolderBrowserError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }
}

crow::response Routes::handle_list_journal(const crow::request &req) {
  try {
    int limit = 50;
    if (const char *limit_param = req.url_params.get("limit")) {
      limit = std::stoi(limit_param);
    }
    std::vector<autofile_core::JournalEntry> entries;
    if (const char *status = req.url_params.get("status")) {
      entries = ctx_.journal.list_by_status(autofile_core::pipeline_status_from_string(status),
                                            limit);
    } else {
      entries = ctx_.journal.list_recent(limit);
    }

    nlohmann::json rows = nlohmann::json::array();
    for (const auto &e : entries) {
      rows.push_back(
          {{"id", e.id},
           {"source_path", e.source_path},
           {"destination_path",
            e.destination_path ? nlohmann::json(*e.destination_path) : nlohmann::json(nullptr)},
           {"status", autofile_core::to_string(e.status)},
           {"error_kind", autofile_core::to_string(e.error_kind)},
           {"message", e.message},
           {"ticket_number", e.ticket_number ? nlohmann::json(*e.ticket_number) : nlohmann::json(nullptr)},
           {"title", e.title ? nlohmann::json(*e.title) : nlohmann::json(nullptr)},
           {"created_at", autofile_core::MoveJournalRepo::time_point_to_string(e.created_at)}});
    }
    nlohmann::json response = create_success_response("Journal retrieved");
    response["entries"] = rows;
    return create_json_response(response);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_clear_journal(const crow::request &req) {
  try {
    int older_than_days = 30;
    if (!req.body.empty()) {
      auto body = parse_json_body(req.body);
      older_than_days = body.value("older_than_days", 30);
    }
    const int removed = ctx_.journal.clear_older_than(older_than_days);
    return create_json_response(
        create_success_response("Journal cleared", {{"removed", removed}}));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 500);
  }
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::invalid_argument("Invalid JSON in request body: " + std::string(e.what()));
  }
}

std::string Routes::require_string(const nlohmann::json &body, const std::string &key) {
  if (!body.contains(key) || !body[key].is_string() || body[key].get<std::string>().empty()) {
    throw std::invalid_argument("Missing or invalid '" + key + "' field");
  }
  return body[key].get<std::string>();
}

std::filesystem::path Routes::current_watch_directory() const {
  return ctx_.watcher.is_running() ? ctx_.watcher.watched_folder() : ctx_.default_watch_directory;
}

std::filesystem::path Routes::require_download(const nlohmann::json &body) {
  const auto watch_directory = current_watch_directory();
  std::filesystem::path file_path = require_string(body, "file_path");
  if (file_path.is_relative()) {
    file_path = watch_directory / file_path;
  }

  std::error_code parent_ec;
  std::error_code root_ec;
  const auto parent = std::filesystem::weakly_canonical(file_path.parent_path(), parent_ec);
  const auto root = std::filesystem::weakly_canonical(watch_directory, root_ec);
  if (parent_ec || root_ec || parent != root) {
    throw std::invalid_argument("'file_path' is not in the watch directory " +
                                watch_directory.string());
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(std::filesystem::symlink_status(file_path, ec))) {
    throw std::invalid_argument("'file_path' is not a regular file: " + file_path.string());
  }
  return file_path;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response response(status_code, json_data.dump());
  response.set_header("Content-Type", "application/json");
  return response;
}

crow::response Routes::create_pipeline_error_response(const autofile_core::AutofileError &e) {
  int status = 500;
  switch (e.kind()) {
    case autofile_core::PipelineErrorKind::NotIdentified:
    case autofile_core::PipelineErrorKind::UnrecognizedLabel:
      status = 422;
      break;
    case autofile_core::PipelineErrorKind::LookupFailure:
      status = 502;
      break;
    case autofile_core::PipelineErrorKind::MoveError:
      status = 409;
      break;
    default:
      status = 500;
      break;
  }
  nlohmann::json response = create_error_response(e.what());
  response["error_kind"] = autofile_core::to_string(e.kind());
  return create_json_response(response, status);
}

}  // namespace autofile_api
