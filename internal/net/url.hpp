#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace framecomp::net {

/*
  An absolute http(s) URL split into the pieces a client connection needs.

  host is lower-cased and, for IPv6 literals, stripped of brackets.
  target is path + query, always starting with '/'; the fragment is dropped.
*/
struct ParsedUrl {
  std::string scheme;
  std::string host;
  uint16_t    port = 0;
  std::string target;
  bool        tls  = false;
  bool        explicit_port = false;

  // host as it goes into a URL or Host header ("[::1]" for IPv6).
  std::string HostForUrl() const;
  std::string ToString() const;
};

/*
  Throws util::ValidationError on anything but a well-formed absolute
  http/https URL without userinfo.
*/
ParsedUrl ParseUrl(std::string_view url);

/*
  Resolve a Location header against the URL that produced it.
  Absolute, scheme-relative ("//host/x") and path-relative forms are handled.
*/
std::string ResolveLocation(const ParsedUrl& base, std::string_view location);

// Scheme check only; no resolution.
bool HasHttpScheme(std::string_view url);

} // namespace framecomp::net
