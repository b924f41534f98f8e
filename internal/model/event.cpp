#include "event.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <utility>

#include "internal/util/errors.hpp"

namespace auklet::model {

Event::Event(util::TimePoint timestamp, int exit_status, std::string signal, SystemMetrics metrics)
    : timestamp_(timestamp), exit_status_(exit_status), signal_(std::move(signal)), metrics_(metrics) {}

const std::string& Event::Topic(const Topics& topics) const {
  return topics.event;
}

void Event::Brand(std::string uuid, std::string checksum) {
  uuid_     = std::move(uuid);
  checksum_ = std::move(checksum);
}

std::string Event::Encode() const {
  google::protobuf::Struct root;
  auto&                    fields = *root.mutable_fields();

  fields["checksum"].set_string_value(checksum_);
  fields["uuid"].set_string_value(uuid_);
  fields["timestamp"].set_string_value(util::ToRfc3339(timestamp_));
  fields["exit_status"].set_number_value(exit_status_);
  if (!signal_.empty()) {
    fields["signal"].set_string_value(signal_);
  }

  auto& system = *fields["system_metrics"].mutable_struct_value()->mutable_fields();
  system["cpu_percent"].set_number_value(metrics_.cpu_percent);
  system["mem_percent"].set_number_value(metrics_.mem_percent);
  // doubles, exact up to 2^53
  system["inbound_traffic"].set_number_value(static_cast<double>(metrics_.inbound_bytes));
  system["outbound_traffic"].set_number_value(static_cast<double>(metrics_.outbound_bytes));

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!status.ok()) {
    throw util::EncodeError("event encode failed: " + std::string(status.message()));
  }
  return json;
}

} // namespace auklet::model
