#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace framecomp::net {

struct IpAddress {
  enum class Family { kV4, kV6 };

  Family                  family = Family::kV4;
  // v4 uses the first 4 bytes
  std::array<uint8_t, 16> bytes{};

  std::string ToString() const;
};

// Parses a dotted IPv4 or textual IPv6 literal (no brackets).
std::optional<IpAddress> ParseIpLiteral(std::string_view text);

/*
  Returns the name of the blocked range the address falls in, or nullopt
  if it is publicly routable.

  IPv4:  0/8 10/8 100.64/10 127/8 169.254/16 172.16/12 192.0.0/24
         192.168/16 198.18/15 224/4 240/4 255.255.255.255
  IPv6:  :: ::1 fc00::/7 fe80::/10 ff00::/8
  IPv6 forms that carry an IPv4 address are judged as the embedded IPv4:
  mapped ::ffff:a.b.c.d, compatible ::a.b.c.d, NAT64 64:ff9b::/96 and
  6to4 2002::/16.
*/
std::optional<std::string> BlockedRange(const IpAddress& address);

} // namespace framecomp::net
