#include <atomic>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "autofile_core/async/file_watcher_service.hpp"

#if defined(__linux__)
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace autofile_core::async {

#if defined(__linux__)

namespace {

constexpr uint32_t kWatchMask =
    IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_TO | IN_MOVED_FROM | IN_DELETE | IN_DELETE_SELF;

// Single-directory inotify watch with a poll loop so stop() never blocks on read().
class InotifyBackend : public IFileWatcherBackend {
 public:
  InotifyBackend(std::filesystem::path root, Handler handler)
      : root_(std::move(root)), handler_(std::move(handler)) {}

  ~InotifyBackend() override {
    stop();
  }

  void start() override {
    if (running_.load()) return;

    fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
      throw std::runtime_error(std::string("inotify_init1 failed: ") + std::strerror(errno));
    }
    wd_ = ::inotify_add_watch(fd_, root_.c_str(), kWatchMask);
    if (wd_ < 0) {
      const int err = errno;
      ::close(fd_);
      fd_ = -1;
      throw std::runtime_error("inotify_add_watch failed for " + root_.string() + ": " +
                               std::strerror(err));
    }

    running_.store(true);
    thread_ = std::thread([this] { this->watch_loop(); });
  }

  void stop() override {
    running_.store(false);
    if (thread_.joinable()) thread_.join();
    if (fd_ >= 0) {
      if (wd_ >= 0) ::inotify_rm_watch(fd_, wd_);
      ::close(fd_);
    }
    fd_ = -1;
    wd_ = -1;
  }

 private:
  void watch_loop() {
    alignas(struct inotify_event) char buffer[16 * 1024];

    while (running_.load()) {
      struct pollfd pfd {};
      pfd.fd = fd_;
      pfd.events = POLLIN;
      const int ready = ::poll(&pfd, 1, 200);
      if (ready < 0) {
        if (errno == EINTR) continue;
        std::cerr << "[Watcher] poll failed: " << std::strerror(errno) << std::endl;
        break;
      }
      if (ready == 0) continue;

      const ssize_t len = ::read(fd_, buffer, sizeof(buffer));
      if (len <= 0) continue;

      for (ssize_t offset = 0; offset < len;) {
        const auto* raw = reinterpret_cast<const struct inotify_event*>(buffer + offset);
        dispatch(*raw);
        offset += static_cast<ssize_t>(sizeof(struct inotify_event) + raw->len);
      }
    }
  }

  void dispatch(const struct inotify_event& raw) {
    FileWatchEvent ev;
    ev.ts = std::chrono::system_clock::now();
    ev.is_dir = (raw.mask & IN_ISDIR) != 0;
    if (raw.len > 0) {
      ev.path = root_ / std::string(raw.name);
    } else {
      ev.path = root_;
    }

    if (raw.mask & IN_Q_OVERFLOW) {
      ev.kind = EventKind::Overflow;
    } else if (raw.mask & IN_CREATE) {
      ev.kind = EventKind::Created;
    } else if (raw.mask & IN_MOVED_TO) {
      ev.kind = EventKind::Moved;
    } else if (raw.mask & IN_CLOSE_WRITE) {
      ev.kind = EventKind::Modified;
    } else if (raw.mask & (IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF)) {
      ev.kind = EventKind::Deleted;
    } else {
      return;
    }

    try {
      handler_(ev);
    } catch (const std::exception& e) {
      std::cerr << "[Watcher] Event handler failed for " << ev.path.string() << ": " << e.what()
                << std::endl;
    }
  }

  std::filesystem::path root_;
  Handler handler_;
  int fd_ = -1;
  int wd_ = -1;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace

std::unique_ptr<IFileWatcherBackend> make_inotify_backend(const std::filesystem::path& root,
                                                          IFileWatcherBackend::Handler handler) {
  return std::make_unique<InotifyBackend>(root, std::move(handler));
}

#else

std::unique_ptr<IFileWatcherBackend> make_inotify_backend(const std::filesystem::path&,
                                                          IFileWatcherBackend::Handler) {
  return nullptr;
}

#endif

}  // namespace autofile_core::async
