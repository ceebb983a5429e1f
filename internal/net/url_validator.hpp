#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/net/address_policy.hpp"
#include "internal/net/resolver.hpp"
#include "internal/net/url.hpp"

namespace framecomp::net {

struct ValidationResult {
  bool        allowed = false;
  std::string reason;

  ParsedUrl url;
  // address the connection must be pinned to
  IpAddress   pinned;
};

/*
  SSRF gate for every outbound fetch.

  A URL passes only if:
    - scheme is http or https, no userinfo, host present
    - port is in the allowed list
    - EVERY address the host resolves to is outside the blocked ranges

  Any doubt (parse error, resolution failure, empty answer) rejects.
*/
class UrlValidator {
 public:
  UrlValidator(std::shared_ptr<Resolver> resolver, std::vector<uint16_t> allowed_ports);

  // Never throws.
  ValidationResult Validate(const std::string& url) const;

  // Throws util::ValidationError when the URL is rejected.
  ValidationResult Require(const std::string& url) const;

  /*
    Lets exactly address:port past the range and port checks; any other
    port on that address, or any other address, is judged as usual.
    Only for pointing tests at a local server. Call before the validator
    is shared.
  */
  void Exempt(const IpAddress& address, uint16_t port);

 private:
  struct Endpoint {
    IpAddress address;
    uint16_t  port = 0;
  };

  bool PortAllowed(uint16_t port) const;
  bool IsExempt(const IpAddress& address, uint16_t port) const;

  std::shared_ptr<Resolver> resolver_;
  std::vector<uint16_t>     allowed_ports_;
  std::vector<Endpoint>     exempt_;
};

} // namespace framecomp::net
