#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "auklet/broker/v1/broker.grpc.pb.h"
#include "config/config.pb.h"
#include "internal/broker/broker.hpp"

namespace auklet::broker {

/*
  Broker reached through the BrokerService publish gateway.

  Connect() builds mutual TLS credentials from the configured material and
  uses the first endpoint that connects in time.
*/
class GrpcBroker final : public Broker {
 public:
  GrpcBroker(std::shared_ptr<grpc::Channel> channel, std::string client_id, std::chrono::milliseconds send_timeout);

  // Throws BrokerError when no endpoint connects, ConfigError on bad TLS material.
  static std::unique_ptr<GrpcBroker> Connect(const auklet::runtime::config::BrokerConfig& config);

  void Send(const std::string& topic, const std::string& value) override;
  void Close() override;

 private:
  std::mutex                                         mutex_;
  std::shared_ptr<grpc::Channel>                     channel_;
  std::unique_ptr<auklet::broker::v1::BrokerService::Stub> stub_;
  std::string                                        client_id_;
  std::chrono::milliseconds                          send_timeout_;
};

} // namespace auklet::broker
