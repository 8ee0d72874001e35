#include "autofile_api/server.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace autofile_api {

Server::Server(const std::string &host, int port) : host_(host) {
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Invalid API port: " + std::to_string(port));
  }
  port_ = static_cast<std::uint16_t>(port);
}

Server::~Server() {
  try {
    stop();
  } catch (const std::exception &e) {
    std::cerr << "[Server] Shutdown error: " << e.what() << std::endl;
  }
}

void Server::start() {
  if (running_) {
    return;
  }
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(port_).bindaddr(host_).loglevel(crow::LogLevel::Warning).run();
  });

  // A listener that fails to bind makes run() return almost at once
  if (server_thread_future_.wait_for(std::chrono::milliseconds(300)) ==
      std::future_status::ready) {
    // run() returned before serving anything; get() rethrows its exception if any
    server_thread_future_.get();
    throw std::runtime_error("API server failed to listen on " + host_ + ":" +
                             std::to_string(port_));
  }
  running_ = true;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  running_ = false;

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
}

}  // namespace autofile_api
