#include "base64.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <vector>

#include "errors.hpp"

namespace auklet::util {

std::string DecodeBase64(std::string_view encoded) {
  std::string compact;
  compact.reserve(encoded.size());
  for (char c : encoded) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      compact.push_back(c);
    }
  }

  if (compact.empty()) {
    return {};
  }
  if (compact.size() % 4 != 0) {
    throw ConfigError("base64 input length is not a multiple of 4");
  }

  std::vector<unsigned char> out(compact.size() / 4 * 3);
  const int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(compact.data()),
                                      static_cast<int>(compact.size()));
  if (decoded < 0) {
    throw ConfigError("invalid base64 input");
  }

  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t size = static_cast<std::size_t>(decoded);
  for (auto it = compact.rbegin(); it != compact.rend() && *it == '='; ++it) {
    --size;
  }
  return std::string(reinterpret_cast<const char*>(out.data()), size);
}

} // namespace auklet::util
