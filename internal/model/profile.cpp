#include "profile.hpp"

#include <google/protobuf/util/json_util.h>

#include <utility>

#include "internal/util/errors.hpp"

namespace auklet::model {

Profile::Profile(google::protobuf::Value payload) : payload_(std::move(payload)) {}

Profile Profile::Decode(std::string_view json) {
  if (json.find_first_not_of(" \t\r\n") == std::string_view::npos) {
    throw util::DecodeError("invalid profile record: empty");
  }

  google::protobuf::Value value;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &value);
  if (!status.ok()) {
    throw util::DecodeError("invalid profile record: " + std::string(status.message()));
  }
  return Profile(std::move(value));
}

const std::string& Profile::Topic(const Topics& topics) const {
  return topics.profile;
}

void Profile::Brand(std::string uuid, std::string checksum) {
  uuid_     = std::move(uuid);
  checksum_ = std::move(checksum);
}

std::string Profile::Encode() const {
  google::protobuf::Struct root;
  auto&                    fields = *root.mutable_fields();

  fields["checksum"].set_string_value(checksum_);
  fields["uuid"].set_string_value(uuid_);
  fields["profile"] = payload_;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!status.ok()) {
    throw util::EncodeError("profile encode failed: " + std::string(status.message()));
  }
  return json;
}

} // namespace auklet::model
