#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace mediacache::util {

/*
  UUID helpers

  Stream ids handed to players are random RFC4122 v4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

} // namespace mediacache::util
