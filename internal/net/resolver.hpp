#pragma once

#include <string>
#include <vector>

#include "internal/net/address_policy.hpp"

namespace framecomp::net {

/*
  DNS seam. The validator checks every address returned here, and the
  fetcher connects to the one it validated.
*/
class Resolver {
 public:
  virtual ~Resolver() = default;

  // Throws util::ValidationError when the name does not resolve.
  virtual std::vector<IpAddress> Resolve(const std::string& host) = 0;
};

// getaddrinfo(3), both address families.
class SystemResolver final : public Resolver {
 public:
  std::vector<IpAddress> Resolve(const std::string& host) override;
};

} // namespace framecomp::net
