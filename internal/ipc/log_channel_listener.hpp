#pragma once

#include <atomic>
#include <cstddef>
#include <ostream>
#include <string>

#include "internal/ipc/session_listener.hpp"

namespace auklet::ipc {

/*
  LogChannelListener

  Packet socket for the child's log output. Each packet is written to the
  sink verbatim and flushed, no framing is added or removed. Packets of any
  size the socket accepts are copied whole.
*/
class LogChannelListener {
 public:
  LogChannelListener(std::string path, std::ostream& sink);

  void Start() { listener_.Start(); }
  void Close() { listener_.Close(); }

  const std::string& path() const { return listener_.path(); }
  std::size_t        bytes() const { return bytes_.load(); }

 private:
  void Serve(int fd);

  std::ostream&            sink_;
  std::atomic<std::size_t> bytes_{0};

  SessionListener listener_;
};

} // namespace auklet::ipc
