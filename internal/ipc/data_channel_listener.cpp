#include "data_channel_listener.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <utility>

#include "internal/model/profile.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace auklet::ipc {

namespace {
constexpr std::size_t kReadChunk = 64 * 1024;
}

DataChannelListener::DataChannelListener(std::string path, std::shared_ptr<pipeline::ObjectChannel> channel,
                                         std::size_t max_record_bytes)
    : channel_(std::move(channel)),
      max_record_bytes_(max_record_bytes == 0 ? kDefaultMaxRecordBytes : max_record_bytes),
      listener_("data", std::move(path), SOCK_STREAM, [this](int fd) { Serve(fd); }) {}

void DataChannelListener::Serve(int fd) {
  std::array<char, kReadChunk> chunk{};
  std::string                  pending;

  while (true) {
    const ssize_t n = ::read(fd, chunk.data(), chunk.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw util::IpcError(util::ErrnoMessage("data channel read"));
    }
    if (n == 0) {
      break;
    }

    pending.append(chunk.data(), static_cast<std::size_t>(n));

    std::size_t start = 0;
    for (std::size_t pos = pending.find('\n'); pos != std::string::npos; pos = pending.find('\n', start)) {
      Emit(std::string_view(pending).substr(start, pos - start));
      start = pos + 1;
    }
    pending.erase(0, start);

    if (pending.size() > max_record_bytes_) {
      throw util::DecodeError("profile record exceeds " + std::to_string(max_record_bytes_) + " bytes");
    }
  }

  // final record without a trailing newline
  if (!pending.empty()) {
    Emit(pending);
  }
}

void DataChannelListener::Emit(std::string_view record) {
  if (!record.empty() && record.back() == '\r') {
    record.remove_suffix(1);
  }
  if (record.size() > max_record_bytes_) {
    throw util::DecodeError("profile record exceeds " + std::to_string(max_record_bytes_) + " bytes");
  }

  channel_->Send(std::make_unique<model::Profile>(model::Profile::Decode(record)));
  ++records_;
  AUKLET_LOG_DEBUG("profile received", {observability::IntField("bytes", static_cast<std::int64_t>(record.size()))});
}

} // namespace auklet::ipc
