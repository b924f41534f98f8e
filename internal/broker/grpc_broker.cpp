#include "grpc_broker.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace auklet::broker {

namespace {

std::shared_ptr<grpc::ChannelCredentials> BuildCredentials(const auklet::runtime::config::TlsConfig& tls) {
  grpc::SslCredentialsOptions options;
  options.pem_root_certs  = util::DecodeBase64(tls.ca());
  options.pem_cert_chain  = util::DecodeBase64(tls.cert());
  options.pem_private_key = util::DecodeBase64(tls.private_key());
  return grpc::SslCredentials(options);
}

} // namespace

GrpcBroker::GrpcBroker(std::shared_ptr<grpc::Channel> channel, std::string client_id, std::chrono::milliseconds send_timeout)
    : channel_(std::move(channel)),
      stub_(auklet::broker::v1::BrokerService::NewStub(channel_)),
      client_id_(std::move(client_id)),
      send_timeout_(send_timeout) {}

std::unique_ptr<GrpcBroker> GrpcBroker::Connect(const auklet::runtime::config::BrokerConfig& config) {
  auto credentials = BuildCredentials(config.tls());

  for (const auto& endpoint : config.endpoints()) {
    auto channel  = grpc::CreateChannel(endpoint, credentials);
    auto deadline = std::chrono::system_clock::now() + std::chrono::milliseconds(config.connect_timeout_ms());
    if (channel->WaitForConnected(deadline)) {
      AUKLET_LOG_INFO("broker connected", {observability::StringField("endpoint", endpoint)});
      return std::make_unique<GrpcBroker>(std::move(channel), config.client_id(),
                                          std::chrono::milliseconds(config.send_timeout_ms()));
    }
    AUKLET_LOG_WARN("broker endpoint unreachable", {observability::StringField("endpoint", endpoint)});
  }

  throw util::BrokerError("no broker endpoint reachable");
}

void GrpcBroker::Send(const std::string& topic, const std::string& value) {
  std::lock_guard lock(mutex_);
  if (!stub_) {
    throw util::BrokerError("broker connection closed");
  }

  auklet::broker::v1::PublishRequest req;
  req.set_topic(topic);
  req.set_value(value);
  req.set_client_id(client_id_);

  auklet::broker::v1::PublishResponse resp;
  grpc::ClientContext                 ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + send_timeout_);

  const auto status = stub_->Publish(&ctx, req, &resp);
  if (!status.ok()) {
    throw util::BrokerError("publish to " + topic + " failed: " + status.error_message());
  }
}

void GrpcBroker::Close() {
  std::lock_guard lock(mutex_);
  stub_.reset();
  channel_.reset();
}

} // namespace auklet::broker
