#include "internal/net/address_policy.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <vector>

namespace framecomp::net {

namespace {

struct V4Range {
  uint32_t    network;
  int         prefix;
  const char* name;
};

const std::vector<V4Range>& BlockedV4() {
  static const std::vector<V4Range> kRanges = {
      {0x00000000u, 8, "unspecified"},  {0x0A000000u, 8, "private"},     {0x64400000u, 10, "carrier-nat"},
      {0x7F000000u, 8, "loopback"},     {0xA9FE0000u, 16, "link-local"}, {0xAC100000u, 12, "private"},
      {0xC0000000u, 24, "reserved"},    {0xC0A80000u, 16, "private"},    {0xC6120000u, 15, "benchmark"},
      {0xE0000000u, 4, "multicast"},    {0xF0000000u, 4, "reserved"},    {0xFFFFFFFFu, 32, "broadcast"},
  };
  return kRanges;
}

std::optional<std::string> BlockedV4Range(uint32_t address) {
  for (const auto& range : BlockedV4()) {
    const uint32_t mask = range.prefix == 0 ? 0 : ~uint32_t{0} << (32 - range.prefix);
    if ((address & mask) == range.network) {
      return std::string(range.name);
    }
  }
  return std::nullopt;
}

uint32_t V4At(const std::array<uint8_t, 16>& b, size_t offset) {
  return (uint32_t{b[offset]} << 24) | (uint32_t{b[offset + 1]} << 16) | (uint32_t{b[offset + 2]} << 8) | uint32_t{b[offset + 3]};
}

} // namespace

std::string IpAddress::ToString() const {
  char buffer[INET6_ADDRSTRLEN] = {};
  const int af = family == Family::kV4 ? AF_INET : AF_INET6;
  if (!inet_ntop(af, bytes.data(), buffer, sizeof(buffer))) {
    return {};
  }
  return buffer;
}

std::optional<IpAddress> ParseIpLiteral(std::string_view text) {
  std::string value(text);
  IpAddress   address;
  if (inet_pton(AF_INET, value.c_str(), address.bytes.data()) == 1) {
    address.family = IpAddress::Family::kV4;
    return address;
  }
  if (inet_pton(AF_INET6, value.c_str(), address.bytes.data()) == 1) {
    address.family = IpAddress::Family::kV6;
    return address;
  }
  return std::nullopt;
}

std::optional<std::string> BlockedRange(const IpAddress& address) {
  const auto& b = address.bytes;

  if (address.family == IpAddress::Family::kV4) {
    return BlockedV4Range(V4At(b, 0));
  }

  auto zero_until = [&](size_t end) { return std::all_of(b.begin(), b.begin() + end, [](uint8_t v) { return v == 0; }); };

  if (zero_until(15) && b[15] == 0) return std::string("unspecified");
  if (zero_until(15) && b[15] == 1) return std::string("loopback");

  // ::ffff:a.b.c.d (mapped) and ::a.b.c.d (compatible)
  if (zero_until(10) && ((b[10] == 0xff && b[11] == 0xff) || (b[10] == 0 && b[11] == 0))) {
    return BlockedV4Range(V4At(b, 12));
  }
  // NAT64 well-known prefix 64:ff9b::/96
  if (b[0] == 0x00 && b[1] == 0x64 && b[2] == 0xff && b[3] == 0x9b &&
      std::all_of(b.begin() + 4, b.begin() + 12, [](uint8_t v) { return v == 0; })) {
    return BlockedV4Range(V4At(b, 12));
  }
  // 6to4 2002:a.b.c.d::/48
  if (b[0] == 0x20 && b[1] == 0x02) {
    return BlockedV4Range(V4At(b, 2));
  }

  if ((b[0] & 0xfe) == 0xfc) return std::string("unique-local");
  if (b[0] == 0xfe && (b[1] & 0xc0) == 0x80) return std::string("link-local");
  if (b[0] == 0xff) return std::string("multicast");

  return std::nullopt;
}

} // namespace framecomp::net
