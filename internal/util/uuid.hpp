#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace auklet::util {

/*
  UUID helpers

  Record ids are random RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace auklet::util
