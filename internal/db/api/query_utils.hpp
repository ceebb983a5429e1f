#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

namespace framecomp::db {

constexpr uint32_t kDefaultPageLimit = 25;
constexpr uint32_t kMaxPageLimit     = 100;

// 0 means default; anything above the cap is clamped.
inline uint32_t ClampPageLimit(uint32_t limit) {
  if (limit == 0) return kDefaultPageLimit;
  return std::min(limit, kMaxPageLimit);
}

// SQL OFFSET is a signed 64-bit value; larger offsets still mean "past the end".
inline int64_t ClampPageOffset(uint64_t offset) {
  return static_cast<int64_t>(std::min<uint64_t>(offset, static_cast<uint64_t>(std::numeric_limits<int64_t>::max())));
}

/*
  LIKE pattern for a substring match, with '\' as the escape character:
      "10%_a" -> "%10\%\_a%"
*/
inline std::string ContainsPattern(const std::string& needle) {
  std::string pattern = "%";
  for (char c : needle) {
    if (c == '\\' || c == '%' || c == '_') pattern.push_back('\\');
    pattern.push_back(c);
  }
  pattern.push_back('%');
  return pattern;
}

} // namespace framecomp::db
