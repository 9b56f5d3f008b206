#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace beacon::util {

/*
  UUID helpers

  Heartbeat, job audit and rejection rows use RFC4122 v4 ids in text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewUuidString() {
  return ToString(GenerateUUID());
}

} // namespace beacon::util
