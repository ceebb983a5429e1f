#include "internal/net/resolver.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstring>
#include <memory>

#include "internal/util/errors.hpp"

namespace framecomp::net {

std::vector<IpAddress> SystemResolver::Resolve(const std::string& host) {
  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* raw = nullptr;
  int       rc  = getaddrinfo(host.c_str(), nullptr, &hints, &raw);
  if (rc != 0) {
    throw util::ValidationError("could not resolve host " + host + ": " + gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> results(raw, &freeaddrinfo);

  std::vector<IpAddress> addresses;
  for (auto* ai = results.get(); ai != nullptr; ai = ai->ai_next) {
    IpAddress address;
    if (ai->ai_family == AF_INET) {
      const auto* sin = reinterpret_cast<const sockaddr_in*>(ai->ai_addr);
      address.family  = IpAddress::Family::kV4;
      std::memcpy(address.bytes.data(), &sin->sin_addr, 4);
    } else if (ai->ai_family == AF_INET6) {
      const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(ai->ai_addr);
      address.family   = IpAddress::Family::kV6;
      std::memcpy(address.bytes.data(), &sin6->sin6_addr, 16);
    } else {
      continue;
    }
    addresses.push_back(address);
  }
  return addresses;
}

} // namespace framecomp::net
