#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include "internal/model/relayable.hpp"

namespace auklet::pipeline {

/*
  Ordered hand-off between the producers (supervisor, data listener) and the
  outbound relay.

  Any number of threads may Send, exactly one thread Receives. Close() ends
  input but keeps what is queued: Receive() keeps returning items in order
  and only reports closure once the queue is empty.

  capacity == 0 means unbounded; otherwise Send blocks while full.
*/
class ObjectChannel {
 public:
  explicit ObjectChannel(std::size_t capacity = 0);

  ObjectChannel(const ObjectChannel&)            = delete;
  ObjectChannel& operator=(const ObjectChannel&) = delete;

  // Throws InvalidState after Close().
  void Send(std::unique_ptr<model::Relayable> item);

  // blocking wait; nullptr once closed and drained
  std::unique_ptr<model::Relayable> Receive();

  void Close();

  bool        IsClosed() const;
  std::size_t Size() const;

 private:
  const std::size_t capacity_;

  mutable std::mutex                            mutex_;
  std::condition_variable                       not_empty_;
  std::condition_variable                       not_full_;
  std::deque<std::unique_ptr<model::Relayable>> queue_;
  bool                                          closed_ = false;
};

} // namespace auklet::pipeline
