#pragma once

#include <string>
#include <string_view>

namespace auklet::util {

// Standard alphabet with padding. Whitespace (PEM line breaks) is ignored.
// Throws ConfigError on malformed input.
std::string DecodeBase64(std::string_view encoded);

} // namespace auklet::util
