#pragma once

#include <stdexcept>
#include <string>

namespace auklet::util {

/*
  Central error types.

  Startup code lets these propagate to main (fatal). Worker threads capture
  them and hand them back from Close().
*/

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SupervisorError : public std::runtime_error {
 public:
  explicit SupervisorError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IpcError : public std::runtime_error {
 public:
  explicit IpcError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class EncodeError : public std::runtime_error {
 public:
  explicit EncodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BrokerError : public std::runtime_error {
 public:
  explicit BrokerError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// "<action> failed: <strerror(errno)>"
std::string ErrnoMessage(const std::string& action);

} // namespace auklet::util
