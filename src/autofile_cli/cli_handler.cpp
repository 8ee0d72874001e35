#include "autofile_cli/cli_handler.hpp"
#include <cctype>
#include <iostream>
#include <map>

namespace autofile_cli {

namespace {

// Collects "--flag value" pairs after the command word. Boolean switches
// (--no-remember) take no value.
std::map<std::string, std::string> parse_flags(int argc, char* argv[], int first) {
    std::map<std::string, std::string> flags;
    for (int i = first; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--no-remember") {
            flags[flag] = "1";
            continue;
        }
        if (flag.rfind("-", 0) != 0) {
            throw CliError("Unexpected argument: " + flag);
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        flags[flag] = argv[++i];
    }
    return flags;
}

std::string flag_value(const std::map<std::string, std::string>& flags,
                       const std::string& long_name, const std::string& short_name) {
    auto it = flags.find(long_name);
    if (it == flags.end()) {
        it = flags.find(short_name);
    }
    return it == flags.end() ? std::string() : it->second;
}

int int_flag(const std::map<std::string, std::string>& flags, const std::string& long_name,
             const std::string& short_name, int fallback) {
    const std::string value = flag_value(flags, long_name, short_name);
    if (value.empty()) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw CliError(long_name + " expects a number, got: " + value);
    }
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    while (!api_base_url_.empty() && api_base_url_.back() == '/') {
        api_base_url_.pop_back();
    }
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "status" || command == "st") {
        options.command = Command::Status;
    } else if (command == "watch-start") {
        options.command = Command::WatchStart;
        auto flags = parse_flags(argc, argv, 2);
        options.folder = flag_value(flags, "--folder", "-d");
    } else if (command == "watch-stop") {
        options.command = Command::WatchStop;
    } else if (command == "auto") {
        options.command = Command::AutoOrganize;
        if (argc < 3) {
            throw CliError("Auto command requires on or off. Usage: auto on|off");
        }
        std::string value = argv[2];
        if (value == "on") {
            options.enabled = true;
        } else if (value == "off") {
            options.enabled = false;
        } else {
            throw CliError("Auto command requires on or off, got: " + value);
        }
    } else if (command == "login") {
        options.command = Command::Login;
        auto flags = parse_flags(argc, argv, 2);
        options.username = flag_value(flags, "--user", "-u");
        options.password = flag_value(flags, "--password", "-p");
        options.remember = flags.count("--no-remember") == 0;
        if (options.username.empty() || options.password.empty()) {
            throw CliError("Login command requires credentials. Usage: login --user <name> --password <pw>");
        }
    } else if (command == "downloads" || command == "ls") {
        options.command = Command::Downloads;
    } else if (command == "preview") {
        options.command = Command::Preview;
        auto flags = parse_flags(argc, argv, 2);
        options.file_path = flag_value(flags, "--file", "-f");
        options.title = flag_value(flags, "--title", "-t");
        if (options.file_path.empty() || options.title.empty()) {
            throw CliError("Preview command requires a file and a title. Usage: preview --file <path> --title <title>");
        }
    } else if (command == "process" || command == "p") {
        options.command = Command::Process;
        auto flags = parse_flags(argc, argv, 2);
        options.file_path = flag_value(flags, "--file", "-f");
        options.title = flag_value(flags, "--title", "-t");
        if (options.file_path.empty()) {
            throw CliError("Process command requires a file path. Usage: process --file <path> [--title <title>]");
        }
    } else if (command == "organize-all") {
        options.command = Command::OrganizeAll;
    } else if (command == "move") {
        options.command = Command::Move;
        auto flags = parse_flags(argc, argv, 2);
        options.file_path = flag_value(flags, "--file", "-f");
        options.folder = flag_value(flags, "--folder", "-d");
        if (options.file_path.empty()) {
            throw CliError("Move command requires a file path. Usage: move --file <path> --folder <relative folder>");
        }
    } else if (command == "folders") {
        options.command = Command::Folders;
        auto flags = parse_flags(argc, argv, 2);
        options.folder = flag_value(flags, "--path", "-p");
    } else if (command == "mkdir") {
        options.command = Command::MakeFolder;
        auto flags = parse_flags(argc, argv, 2);
        options.folder = flag_value(flags, "--path", "-p");
        options.name = flag_value(flags, "--name", "-n");
        if (options.name.empty()) {
            throw CliError("Mkdir command requires a name. Usage: mkdir --name <name> [--path <parent>]");
        }
    } else if (command == "journal" || command == "j") {
        options.command = Command::Journal;
        auto flags = parse_flags(argc, argv, 2);
        options.limit = int_flag(flags, "--limit", "-l", 50);
        options.status_filter = flag_value(flags, "--status", "-s");
    } else if (command == "clear-journal") {
        options.command = Command::ClearJournal;
        auto flags = parse_flags(argc, argv, 2);
        options.older_than_days = int_flag(flags, "--days", "-d", 30);
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Status:
            handle_status_command();
            break;
        case Command::WatchStart:
            handle_watch_command(true, options);
            break;
        case Command::WatchStop:
            handle_watch_command(false, options);
            break;
        case Command::AutoOrganize:
            handle_auto_organize_command(options);
            break;
        case Command::Login:
            handle_login_command(options);
            break;
        case Command::Downloads:
            handle_downloads_command();
            break;
        case Command::Preview:
            handle_preview_command(options);
            break;
        case Command::Process:
            handle_process_command(options);
            break;
        case Command::OrganizeAll:
            handle_organize_all_command();
            break;
        case Command::Move:
            handle_move_command(options);
            break;
        case Command::Folders:
            handle_folders_command(options);
            break;
        case Command::MakeFolder:
            handle_mkdir_command(options);
            break;
        case Command::Journal:
            handle_journal_command(options);
            break;
        case Command::ClearJournal:
            handle_clear_journal_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_status_command() {
    print_json_response(make_get_request("/status"));
}

void CliHandler::handle_watch_command(bool start, const CliOptions& options) {
    if (!start) {
        print_json_response(make_post_request("/watch/stop", nlohmann::json::object()));
        return;
    }
    nlohmann::json request_data = nlohmann::json::object();
    if (!options.folder.empty()) {
        request_data["folder"] = options.folder;
    }
    print_json_response(make_post_request("/watch/start", request_data));
}

void CliHandler::handle_auto_organize_command(const CliOptions& options) {
    print_json_response(make_post_request("/auto_organize", {{"enabled", options.enabled}}));
}

void CliHandler::handle_login_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"username", options.username},
        {"password", options.password},
        {"remember", options.remember}
    };
    print_json_response(make_post_request("/login", request_data));
}

void CliHandler::handle_downloads_command() {
    print_downloads(make_get_request("/downloads"));
}

void CliHandler::handle_preview_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"file_path", options.file_path},
        {"title", options.title}
    };
    print_json_response(make_post_request("/preview", request_data));
}

void CliHandler::handle_process_command(const CliOptions& options) {
    std::cout << "Processing file: " << options.file_path << std::endl;

    nlohmann::json request_data = {{"file_path", options.file_path}};
    if (!options.title.empty()) {
        request_data["title"] = options.title;
    }
    print_json_response(make_post_request("/process", request_data));
}

void CliHandler::handle_organize_all_command() {
    std::cout << "Organizing every identified download..." << std::endl;
    print_json_response(make_post_request("/organize_all", nlohmann::json::object()));
}

void CliHandler::handle_move_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"file_path", options.file_path},
        {"folder", options.folder}
    };
    print_json_response(make_post_request("/move_to_folder", request_data));
}

void CliHandler::handle_folders_command(const CliOptions& options) {
    std::string endpoint = "/folders";
    if (!options.folder.empty()) {
        endpoint += "?path=" + url_encode(options.folder);
    }
    print_json_response(make_get_request(endpoint));
}

void CliHandler::handle_mkdir_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"path", options.folder},
        {"name", options.name}
    };
    print_json_response(make_post_request("/folders", request_data));
}

void CliHandler::handle_journal_command(const CliOptions& options) {
    std::string endpoint = "/journal?limit=" + std::to_string(options.limit);
    if (!options.status_filter.empty()) {
        endpoint += "&status=" + url_encode(options.status_filter);
    }
    print_journal(make_get_request(endpoint));
}

void CliHandler::handle_clear_journal_command(const CliOptions& options) {
    print_json_response(
        make_post_request("/journal/clear", {{"older_than_days", options.older_than_days}}));
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    return api_base_url_ + endpoint;
}

std::string CliHandler::url_encode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    curl_easy_reset(curl_handle_);
    return perform(url);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = data.dump();

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    try {
        nlohmann::json response = perform(url);
        curl_slist_free_all(headers);
        return response;
    } catch (...) {
        curl_slist_free_all(headers);
        throw;
    }
}

// Runs the prepared request. Non-200 replies carry {"error": ...} from the
// daemon, which becomes the CliError message.
nlohmann::json CliHandler::perform(const std::string& url) {
    std::string response_buffer;
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        if (!body.is_discarded() && body.contains("error") && body["error"].is_string()) {
            throw CliError(body["error"].get<std::string>() + " (HTTP " +
                           std::to_string(http_code) + ")");
        }
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code));
    }
    if (body.is_discarded()) {
        throw CliError("Server returned invalid JSON");
    }
    return body;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_downloads(const nlohmann::json& response) {
    if (!response.contains("files") || !response["files"].is_array() || response["files"].empty()) {
        std::cout << "No identified downloads." << std::endl;
        return;
    }
    std::cout << "\n=== Identified Downloads ===" << std::endl;
    for (const auto& file : response["files"]) {
        std::cout << "  " << file.value("mtime", "") << "  ";
        if (file["ticket_number"].is_string()) {
            std::cout << "#" << file["ticket_number"].get<std::string>() << "  ";
        } else {
            std::cout << "(no ticket)  ";
        }
        std::cout << file.value("filename", "") << std::endl;
    }
}

void CliHandler::print_journal(const nlohmann::json& response) {
    if (!response.contains("entries") || !response["entries"].is_array() ||
        response["entries"].empty()) {
        std::cout << "Journal is empty." << std::endl;
        return;
    }
    std::cout << "\n=== Move Journal ===" << std::endl;
    for (const auto& entry : response["entries"]) {
        std::cout << "  [" << entry.value("created_at", "") << "] "
                  << entry.value("status", "") << "  " << entry.value("source_path", "");
        if (entry["destination_path"].is_string()) {
            std::cout << " -> " << entry["destination_path"].get<std::string>();
        }
        if (entry.value("status", "") == "FAILED") {
            std::cout << "  (" << entry.value("error_kind", "") << ": "
                      << entry.value("message", "") << ")";
        }
        std::cout << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << R"(
Autofile CLI - files tracker downloads into labelled folders

Usage: autofile <command> [options]

Watcher Commands:
  status, st          Show watcher state, counters and login state
  watch-start         Start watching the downloads folder
    --folder, -d <path>    Folder to watch (default: configured folder)
  watch-stop          Stop watching
  auto on|off         Toggle automatic filing of new arrivals

Tracker Commands:
  login               Log in to the ticket tracker
    --user, -u <name>      Username
    --password, -p <pw>    Password
    --no-remember          Do not store the credentials

Filing Commands:
  downloads, ls       List identified downloads, newest first
  preview             Show where a file would be filed for a title
    --file, -f <path>      Downloaded file
    --title, -t <title>    Ticket title, e.g. "[Acme][P100] Door sensor"
  process, p          File one download now
    --file, -f <path>      Downloaded file
    --title, -t <title>    Use this title instead of the tracker lookup
  organize-all        File every identified download with a ticket number
  move                Move a file into a chosen folder
    --file, -f <path>      Downloaded file
    --folder, -d <rel>     Folder relative to the destination root
  folders             List folders under the destination root
    --path, -p <rel>       Sub-folder to list
  mkdir               Create a folder under the destination root
    --name, -n <name>      Folder name
    --path, -p <rel>       Parent folder

Journal Commands:
  journal, j          Show recent filing outcomes
    --limit, -l <num>      Number of rows (default: 50)
    --status, -s <status>  MOVED, SKIPPED or FAILED
  clear-journal       Delete old journal rows
    --days, -d <num>       Older than this many days (default: 30)

  help, h             Show this help

Environment:
  API_BASE_URL        Daemon address (default: http://127.0.0.1:3131)
)" << std::endl;
}

}  // namespace autofile_cli
