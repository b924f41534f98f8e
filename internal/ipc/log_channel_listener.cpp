#include "log_channel_listener.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace auklet::ipc {

namespace {

constexpr std::size_t kInitialPacket = 64 * 1024;

ssize_t Receive(int fd, void* buffer, std::size_t size, int flags) {
  while (true) {
    const ssize_t n = ::recv(fd, buffer, size, flags);
    if (n >= 0) {
      return n;
    }
    if (errno != EINTR) {
      throw util::IpcError(util::ErrnoMessage("log channel recv"));
    }
  }
}

} // namespace

LogChannelListener::LogChannelListener(std::string path, std::ostream& sink)
    : sink_(sink), listener_("log", std::move(path), SOCK_SEQPACKET, [this](int fd) { Serve(fd); }) {}

void LogChannelListener::Serve(int fd) {
  std::vector<char> packet(kInitialPacket);

  while (true) {
    // MSG_TRUNC reports the full length of the next packet, so the buffer can
    // grow before the packet is consumed.
    const ssize_t size = Receive(fd, nullptr, 0, MSG_PEEK | MSG_TRUNC);
    if (size == 0) {
      return;
    }
    if (static_cast<std::size_t>(size) > packet.size()) {
      packet.resize(static_cast<std::size_t>(size));
    }

    const ssize_t n = Receive(fd, packet.data(), packet.size(), 0);
    if (n != size) {
      throw util::IpcError("log channel packet of " + std::to_string(size) + " bytes read as " + std::to_string(n));
    }

    sink_.write(packet.data(), n);
    sink_.flush();
    if (!sink_) {
      throw util::IpcError("log sink write failed");
    }
    bytes_ += static_cast<std::size_t>(n);
  }
}

} // namespace auklet::ipc
