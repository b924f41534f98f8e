#include "outbound_relay.hpp"

#include <chrono>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace auklet::relay {

using observability::IntField;
using observability::StringField;

OutboundRelay::OutboundRelay(std::shared_ptr<const RelayContext> context, std::shared_ptr<pipeline::ObjectChannel> channel,
                             std::unique_ptr<broker::Broker> broker)
    : context_(std::move(context)), channel_(std::move(channel)), broker_(std::move(broker)) {}

OutboundRelay::~OutboundRelay() {
  if (thread_.joinable()) {
    channel_->Close();
    thread_.join();
  }
  if (broker_) {
    broker_->Close();
  }
}

void OutboundRelay::Start() {
  if (thread_.joinable()) {
    throw util::InvalidState("outbound relay already started");
  }
  thread_ = std::thread(&OutboundRelay::Run, this);
}

void OutboundRelay::Close() {
  if (thread_.joinable()) {
    thread_.join();
  }

  AUKLET_LOG_INFO("closing broker producer", {IntField("delivered", static_cast<std::int64_t>(delivered_.load())),
                                              IntField("discarded", static_cast<std::int64_t>(discarded_.load()))});
  if (broker_) {
    broker_->Close();
    broker_.reset();
  }

  if (error_) {
    std::rethrow_exception(std::exchange(error_, nullptr));
  }
}

void OutboundRelay::Run() {
  while (auto item = channel_->Receive()) {
    if (error_) {
      ++discarded_;
      continue;
    }

    try {
      Deliver(*item);
      ++delivered_;
    } catch (const std::exception& e) {
      AUKLET_LOG_ERROR("relay stopped", {StringField("error", e.what())});
      error_ = std::current_exception();
    }
  }
}

void OutboundRelay::Deliver(model::Relayable& item) {
  item.Brand(util::ToString(util::GenerateUUID()), context_->checksum);

  const std::string& topic = item.Topic(context_->topics);
  const std::string  value = item.Encode();

  observability::SpanScope span("relay.deliver");
  span.SetAttribute("topic", topic);
  span.SetAttribute("bytes", static_cast<std::int64_t>(value.size()));

  const auto start = std::chrono::steady_clock::now();
  try {
    broker_->Send(topic, value);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordDelivery(topic, false);
    throw;
  }
  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);

  observability::Metrics::Instance().RecordDelivery(topic, true);
  observability::Metrics::Instance().ObserveSendLatencyMs(topic, elapsed.count());
  AUKLET_LOG_DEBUG("record delivered", {StringField("topic", topic), IntField("bytes", static_cast<std::int64_t>(value.size())),
                                        StringField("value", value)});
}

} // namespace auklet::relay
