#pragma once

#include <string>

namespace auklet::model {

// Destination topic per record kind, resolved once from configuration.
struct Topics {
  std::string event;
  std::string profile;
};

/*
  Relayable

  Anything the outbound relay can ship. The relay only sees this interface:
  it asks for the topic, brands the record, and sends the encoded bytes.
*/
class Relayable {
 public:
  virtual ~Relayable() = default;

  virtual const std::string& Topic(const Topics& topics) const = 0;

  // Assigns the record id and the executable checksum. Nothing else changes.
  virtual void Brand(std::string uuid, std::string checksum) = 0;

  // JSON wire form. Throws EncodeError.
  virtual std::string Encode() const = 0;
};

} // namespace auklet::model
