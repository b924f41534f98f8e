// Stand-in for an instrumented program: reports through both IPC channels,
// then exits with the requested status.
//
//   instrumented_child <exit_status> [data record ...]
//
// INSTRUMENTED_CHILD_LOG_PACKET=<bytes> adds one log packet of that size after
// the banner.

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <string>

namespace {

int Connect(const char* path, int type) {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path, sizeof(addr.sun_path) - 1);

  const int fd = ::socket(AF_UNIX, type, 0);
  if (fd < 0 || ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
    return -1;
  }
  return fd;
}

bool WriteAll(int fd, const std::string& data) {
  std::size_t done = 0;
  while (done < data.size()) {
    const ssize_t n = ::write(fd, data.data() + done, data.size() - done);
    if (n <= 0) {
      return false;
    }
    done += static_cast<std::size_t>(n);
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  const int   exit_status = argc > 1 ? std::atoi(argv[1]) : 0;
  const char* data_path   = std::getenv("AUKLET_DATA_SOCKET");
  const char* log_path    = std::getenv("AUKLET_LOG_SOCKET");
  const char* supervisor  = std::getenv("AUKLET_SUPERVISOR_PID");
  if (data_path == nullptr || log_path == nullptr || supervisor == nullptr) {
    return 100;
  }
  if (std::atoi(supervisor) != ::getppid()) {
    return 101;
  }

  const int log_fd  = Connect(log_path, SOCK_SEQPACKET);
  const int data_fd = Connect(data_path, SOCK_STREAM);
  if (log_fd < 0 || data_fd < 0) {
    return 102;
  }

  const std::string banner = "instrumented child started\n";
  if (::send(log_fd, banner.data(), banner.size(), 0) < 0) {
    return 103;
  }

  if (const char* size = std::getenv("INSTRUMENTED_CHILD_LOG_PACKET")) {
    const std::string packet(static_cast<std::size_t>(std::atol(size)), 'x');
    const int         sndbuf = static_cast<int>(packet.size()) * 2 + 4096;
    ::setsockopt(log_fd, SOL_SOCKET, SO_SNDBUF, &sndbuf, sizeof(sndbuf));
    if (::send(log_fd, packet.data(), packet.size(), 0) != static_cast<ssize_t>(packet.size())) {
      return 105;
    }
  }

  for (int i = 2; i < argc; ++i) {
    if (!WriteAll(data_fd, std::string(argv[i]) + "\n")) {
      return 104;
    }
  }

  ::close(data_fd);
  ::close(log_fd);
  return exit_status;
}
