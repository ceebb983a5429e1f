#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace framecomp::util {

/*
  UUID helpers

  Project and run ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

bool IsUUIDString(const std::string& str);

} // namespace framecomp::util
