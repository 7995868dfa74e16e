#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace omni::util {

/*
  UUID helpers

  Embedding chunk ids are random RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string GenerateUUIDString();

} // namespace omni::util
