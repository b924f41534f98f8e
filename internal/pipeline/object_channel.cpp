#include "object_channel.hpp"

#include "internal/util/errors.hpp"

namespace auklet::pipeline {

ObjectChannel::ObjectChannel(std::size_t capacity) : capacity_(capacity) {}

void ObjectChannel::Send(std::unique_ptr<model::Relayable> item) {
  if (!item) {
    throw util::InvalidState("object channel: null item");
  }

  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return closed_ || capacity_ == 0 || queue_.size() < capacity_; });

    if (closed_) {
      throw util::InvalidState("object channel: send after close");
    }
    queue_.push_back(std::move(item));
  }
  not_empty_.notify_one();
}

std::unique_ptr<model::Relayable> ObjectChannel::Receive() {
  std::unique_ptr<model::Relayable> item;
  {
    std::unique_lock lock(mutex_);

    not_empty_.wait(lock, [&] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) return nullptr;

    item = std::move(queue_.front());
    queue_.pop_front();
  }
  not_full_.notify_one();
  return item;
}

void ObjectChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool ObjectChannel::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::size_t ObjectChannel::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace auklet::pipeline
