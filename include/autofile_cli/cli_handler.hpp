#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace autofile_cli
{

  enum class Command
  {
    Status,
    WatchStart,
    WatchStop,
    AutoOrganize,
    Login,
    Downloads,
    Preview,
    Process,
    OrganizeAll,
    Move,
    Folders,
    MakeFolder,
    Journal,
    ClearJournal,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string title;
    std::string folder;
    std::string name;
    std::string username;
    std::string password;
    std::string status_filter;
    bool enabled = true;
    bool remember = true;
    int limit = 50;
    int older_than_days = 30;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments. Throws CliError on bad usage.
    static CliOptions parse_arguments(int argc, char *argv[]);

    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

    // Query-string escaping for GET parameters
    static std::string url_encode(const std::string &value);

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_status_command();
    void handle_watch_command(bool start, const CliOptions &options);
    void handle_auto_organize_command(const CliOptions &options);
    void handle_login_command(const CliOptions &options);
    void handle_downloads_command();
    void handle_preview_command(const CliOptions &options);
    void handle_process_command(const CliOptions &options);
    void handle_organize_all_command();
    void handle_move_command(const CliOptions &options);
    void handle_folders_command(const CliOptions &options);
    void handle_mkdir_command(const CliOptions &options);
    void handle_journal_command(const CliOptions &options);
    void handle_clear_journal_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform(const std::string &url);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_downloads(const nlohmann::json &response);
    void print_journal(const nlohmann::json &response);
    static void print_help();
    std::string build_url(const std::string &endpoint) const;
  };

}
