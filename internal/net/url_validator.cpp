#include "internal/net/url_validator.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace framecomp::net {

namespace {

ValidationResult Reject(ValidationResult result, std::string reason) {
  result.allowed = false;
  result.reason  = std::move(reason);
  return result;
}

} // namespace

UrlValidator::UrlValidator(std::shared_ptr<Resolver> resolver, std::vector<uint16_t> allowed_ports)
    : resolver_(std::move(resolver)), allowed_ports_(std::move(allowed_ports)) {
  if (allowed_ports_.empty()) {
    allowed_ports_ = {80, 443};
  }
}

bool UrlValidator::PortAllowed(uint16_t port) const {
  return std::find(allowed_ports_.begin(), allowed_ports_.end(), port) != allowed_ports_.end();
}

void UrlValidator::Exempt(const IpAddress& address, uint16_t port) {
  exempt_.push_back(Endpoint{address, port});
}

bool UrlValidator::IsExempt(const IpAddress& address, uint16_t port) const {
  return std::any_of(exempt_.begin(), exempt_.end(), [&](const Endpoint& e) {
    return e.port == port && e.address.family == address.family && e.address.bytes == address.bytes;
  });
}

ValidationResult UrlValidator::Validate(const std::string& url) const {
  ValidationResult result;

  try {
    result.url = ParseUrl(url);
  } catch (const util::ValidationError& e) {
    return Reject(std::move(result), e.what());
  }

  const bool port_allowed = PortAllowed(result.url.port);
  const bool port_exempt  = std::any_of(exempt_.begin(), exempt_.end(), [&](const Endpoint& e) { return e.port == result.url.port; });
  if (!port_allowed && !port_exempt) {
    return Reject(std::move(result), "port not allowed: " + std::to_string(result.url.port));
  }

  std::vector<IpAddress> addresses;
  if (auto literal = ParseIpLiteral(result.url.host)) {
    addresses.push_back(*literal);
  } else {
    try {
      addresses = resolver_->Resolve(result.url.host);
    } catch (const std::exception& e) {
      return Reject(std::move(result), e.what());
    }
  }

  if (addresses.empty()) {
    return Reject(std::move(result), "host resolved to no addresses: " + result.url.host);
  }

  for (const auto& address : addresses) {
    if (IsExempt(address, result.url.port)) {
      continue;
    }
    if (!port_allowed) {
      return Reject(std::move(result), "port not allowed: " + std::to_string(result.url.port));
    }
    if (auto range = BlockedRange(address)) {
      return Reject(std::move(result), "address " + address.ToString() + " of " + result.url.host + " is " + *range);
    }
  }

  result.allowed = true;
  result.pinned  = addresses.front();
  return result;
}

ValidationResult UrlValidator::Require(const std::string& url) const {
  auto result = Validate(url);
  if (!result.allowed) {
    FRAMECOMP_LOG_WARN("url rejected", {observability::StringField("url", url), observability::StringField("reason", result.reason)});
    throw util::ValidationError("URL rejected: " + result.reason);
  }
  return result;
}

} // namespace framecomp::net
