#pragma once

#include <string>

namespace auklet::broker {

/*
  Transport to the message broker.

  Send() is synchronous: it returns once the broker acknowledged the record
  and throws BrokerError otherwise. Close() releases the connection; Send()
  after Close() throws.
*/
class Broker {
 public:
  virtual ~Broker() = default;

  virtual void Send(const std::string& topic, const std::string& value) = 0;
  virtual void Close()                                                  = 0;
};

} // namespace auklet::broker
