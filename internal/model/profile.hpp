#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

#include "internal/model/relayable.hpp"

namespace auklet::model {

/*
  Profile

  One instrumentation record from the data channel. The payload is any JSON
  value and is relayed untouched.
*/
class Profile final : public Relayable {
 public:
  explicit Profile(google::protobuf::Value payload);

  // Parses exactly one JSON value. Throws DecodeError.
  static Profile Decode(std::string_view json);

  const std::string& Topic(const Topics& topics) const override;
  void               Brand(std::string uuid, std::string checksum) override;
  std::string        Encode() const override;

  const std::string&             checksum() const { return checksum_; }
  const std::string&             uuid() const { return uuid_; }
  const google::protobuf::Value& payload() const { return payload_; }

 private:
  std::string             checksum_;
  std::string             uuid_;
  google::protobuf::Value payload_;
};

} // namespace auklet::model
