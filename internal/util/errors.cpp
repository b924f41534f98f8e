#include "errors.hpp"

#include <cerrno>
#include <cstring>

namespace auklet::util {

std::string ErrnoMessage(const std::string& action) {
  const int err = errno;
  return action + " failed: " + std::strerror(err);
}

} // namespace auklet::util
