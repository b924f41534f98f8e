#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <thread>

#include "internal/broker/broker.hpp"
#include "internal/pipeline/object_channel.hpp"
#include "internal/relay/relay_context.hpp"

namespace auklet::relay {

/*
  Single consumer of the object channel.

  Each record is branded, encoded and sent synchronously, one at a time, in
  channel order. The first encode or send failure stops delivery for the rest
  of the run; records still arriving afterwards are discarded so producers
  never wait on a dead consumer. Nothing is retried.
*/
class OutboundRelay {
 public:
  OutboundRelay(std::shared_ptr<const RelayContext> context, std::shared_ptr<pipeline::ObjectChannel> channel,
                std::unique_ptr<broker::Broker> broker);
  ~OutboundRelay();

  OutboundRelay(const OutboundRelay&)            = delete;
  OutboundRelay& operator=(const OutboundRelay&) = delete;

  void Start();

  // Waits for the channel to be closed and drained, releases the broker and
  // rethrows the error that stopped delivery, if any.
  void Close();

  std::size_t delivered() const { return delivered_.load(); }
  std::size_t discarded() const { return discarded_.load(); }

 private:
  void Run();
  void Deliver(model::Relayable& item);

  std::shared_ptr<const RelayContext>      context_;
  std::shared_ptr<pipeline::ObjectChannel> channel_;
  std::unique_ptr<broker::Broker>          broker_;

  std::thread              thread_;
  std::exception_ptr       error_;
  std::atomic<std::size_t> delivered_{0};
  std::atomic<std::size_t> discarded_{0};
};

} // namespace auklet::relay
