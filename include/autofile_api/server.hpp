#pragma once
#include <crow.h>

#include <cstdint>
#include <future>
#include <string>

namespace autofile_api {

// Local control API for the daemon. Crow runs on its own thread so main() can
// keep draining pipeline results.
class Server {
 public:
  Server(const std::string &host, int port);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Returns once the listener is bound; throws std::runtime_error if Crow
  // exited during startup (port in use, bad address).
  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

  const std::string &host() const {
    return host_;
  }
  std::uint16_t port() const {
    return port_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  std::uint16_t port_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};

}  // namespace autofile_api
