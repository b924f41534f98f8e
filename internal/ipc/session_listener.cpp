#include "session_listener.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace auklet::ipc {

namespace {

// A client that has connected but not yet been accepted makes the listening
// socket readable.
bool ConnectionPending(int listen_fd) {
  pollfd pfd{.fd = listen_fd, .events = POLLIN, .revents = 0};
  int    rc;
  do {
    rc = ::poll(&pfd, 1, 0);
  } while (rc < 0 && errno == EINTR);
  return rc > 0 && (pfd.revents & POLLIN) != 0;
}

} // namespace

using observability::StringField;

SessionListener::SessionListener(std::string name, std::string path, int socket_type, Session session)
    : name_(std::move(name)), path_(std::move(path)), socket_type_(socket_type), session_(std::move(session)) {}

SessionListener::~SessionListener() {
  if (thread_.joinable()) {
    Abort();
    thread_.join();
  }
  Release();
}

void SessionListener::Start() {
  if (thread_.joinable() || bound_) {
    throw util::InvalidState(name_ + " listener already started");
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (path_.size() >= sizeof(addr.sun_path)) {
    throw util::IpcError(name_ + " socket path too long: " + path_);
  }
  std::memcpy(addr.sun_path, path_.c_str(), path_.size() + 1);

  // leftover from a dead process that had our pid
  struct stat st {};
  if (::lstat(path_.c_str(), &st) == 0 && S_ISSOCK(st.st_mode)) {
    ::unlink(path_.c_str());
  }

  const int fd = ::socket(AF_UNIX, socket_type_ | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    throw util::IpcError(util::ErrnoMessage(name_ + " socket"));
  }
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
    const auto msg = util::ErrnoMessage(name_ + " bind " + path_);
    ::close(fd);
    throw util::IpcError(msg);
  }
  if (::listen(fd, 1) < 0) {
    const auto msg = util::ErrnoMessage(name_ + " listen " + path_);
    ::close(fd);
    ::unlink(path_.c_str());
    throw util::IpcError(msg);
  }

  {
    std::lock_guard lock(fd_mutex_);
    listen_fd_ = fd;
    bound_     = true;
  }
  AUKLET_LOG_INFO("socket opened", {StringField("channel", name_), StringField("path", path_)});

  thread_ = std::thread(&SessionListener::Run, this);
}

void SessionListener::Wait() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool SessionListener::WaitIfConnected() {
  std::unique_lock lock(fd_mutex_);
  if (!accepted_ && !finished_) {
    if (listen_fd_ < 0 || !ConnectionPending(listen_fd_)) {
      return false;
    }
  }
  finished_cv_.wait(lock, [&] { return finished_; });
  return accepted_;
}

void SessionListener::Close() {
  Wait();

  AUKLET_LOG_INFO("closing socket", {StringField("channel", name_)});
  Release();

  if (error_) {
    std::rethrow_exception(std::exchange(error_, nullptr));
  }
}

void SessionListener::Run() {
  try {
    int listen_fd;
    {
      std::lock_guard lock(fd_mutex_);
      listen_fd = listen_fd_;
    }

    int fd;
    do {
      fd = ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
      throw util::IpcError(util::ErrnoMessage(name_ + " accept"));
    }

    {
      std::lock_guard lock(fd_mutex_);
      conn_fd_  = fd;
      accepted_ = true;
      ::close(listen_fd_);
      listen_fd_ = -1;
    }
    AUKLET_LOG_INFO("connection accepted", {StringField("channel", name_)});

    session_(fd);
    AUKLET_LOG_INFO("connection closed by client", {StringField("channel", name_)});
  } catch (const std::exception& e) {
    AUKLET_LOG_WARN("channel session ended with error", {StringField("channel", name_), StringField("error", e.what())});
    error_ = std::current_exception();
  }

  {
    std::lock_guard lock(fd_mutex_);
    finished_ = true;
  }
  finished_cv_.notify_all();
}

void SessionListener::Abort() {
  std::lock_guard lock(fd_mutex_);
  if (listen_fd_ >= 0) {
    ::shutdown(listen_fd_, SHUT_RDWR);
  }
  if (conn_fd_ >= 0) {
    ::shutdown(conn_fd_, SHUT_RDWR);
  }
}

void SessionListener::Release() {
  std::lock_guard lock(fd_mutex_);
  if (conn_fd_ >= 0) {
    ::close(conn_fd_);
    conn_fd_ = -1;
  }
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  if (bound_) {
    ::unlink(path_.c_str());
    bound_ = false;
  }
}

} // namespace auklet::ipc
