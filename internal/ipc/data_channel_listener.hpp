#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "internal/ipc/session_listener.hpp"
#include "internal/pipeline/object_channel.hpp"

namespace auklet::ipc {

/*
  DataChannelListener

  Stream socket carrying newline-delimited JSON, one profile per line. Each
  decoded line is pushed onto the object channel in arrival order.

  A malformed or oversized record ends the session: nothing after it is
  read, and Close() reports the DecodeError.
*/
class DataChannelListener {
 public:
  static constexpr std::size_t kDefaultMaxRecordBytes = 1 << 20;

  DataChannelListener(std::string path, std::shared_ptr<pipeline::ObjectChannel> channel,
                      std::size_t max_record_bytes = kDefaultMaxRecordBytes);

  void Start() { listener_.Start(); }

  // Returns once the client has hung up and every record it sent is queued.
  // Returns false without waiting when no client has connected.
  bool WaitIfConnected() { return listener_.WaitIfConnected(); }

  void Close() { listener_.Close(); }

  const std::string& path() const { return listener_.path(); }
  std::size_t        records() const { return records_.load(); }

 private:
  void Serve(int fd);
  void Emit(std::string_view record);

  std::shared_ptr<pipeline::ObjectChannel> channel_;
  const std::size_t                        max_record_bytes_;
  std::atomic<std::size_t>                 records_{0};

  // declared last so its thread is joined before the members above go away
  SessionListener listener_;
};

} // namespace auklet::ipc
