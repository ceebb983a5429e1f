#include "internal/net/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include "internal/util/errors.hpp"

namespace framecomp::net {

namespace {

std::string Lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool HasControlOrSpace(std::string_view s) {
  return std::any_of(s.begin(), s.end(), [](unsigned char c) { return c <= 0x20 || c == 0x7f; });
}

} // namespace

std::string ParsedUrl::HostForUrl() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]";
  }
  return host;
}

std::string ParsedUrl::ToString() const {
  std::string out = scheme + "://" + HostForUrl();
  if (explicit_port) {
    out += ":" + std::to_string(port);
  }
  return out + target;
}

ParsedUrl ParseUrl(std::string_view url) {
  if (url.empty()) {
    throw util::ValidationError("empty URL");
  }
  if (HasControlOrSpace(url)) {
    throw util::ValidationError("URL contains whitespace or control characters");
  }

  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) {
    throw util::ValidationError("URL is not absolute");
  }

  ParsedUrl parsed;
  parsed.scheme = Lower(url.substr(0, scheme_end));
  if (parsed.scheme == "https") {
    parsed.tls  = true;
    parsed.port = 443;
  } else if (parsed.scheme == "http") {
    parsed.port = 80;
  } else {
    throw util::ValidationError("scheme not allowed: " + parsed.scheme);
  }

  auto remainder = url.substr(scheme_end + 3);
  auto path_at   = remainder.find_first_of("/?#");
  auto authority = remainder.substr(0, path_at);
  std::string target{path_at == std::string_view::npos ? std::string_view{} : remainder.substr(path_at)};

  if (auto hash = target.find('#'); hash != std::string::npos) {
    target.resize(hash);
  }
  if (target.empty() || target.front() != '/') {
    target.insert(target.begin(), '/');
  }
  parsed.target = std::move(target);

  if (authority.find('@') != std::string_view::npos) {
    throw util::ValidationError("URL must not carry credentials");
  }
  if (authority.empty()) {
    throw util::ValidationError("URL has no host");
  }

  std::string_view host_view;
  std::string_view port_view;
  if (authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      throw util::ValidationError("unterminated IPv6 literal");
    }
    host_view = authority.substr(1, close - 1);
    auto rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') throw util::ValidationError("malformed authority");
      port_view = rest.substr(1);
      parsed.explicit_port = true;
    }
  } else {
    auto colon = authority.rfind(':');
    host_view  = authority.substr(0, colon);
    if (colon != std::string_view::npos) {
      port_view = authority.substr(colon + 1);
      parsed.explicit_port = true;
    }
  }

  if (host_view.empty()) {
    throw util::ValidationError("URL has no host");
  }
  parsed.host = Lower(host_view);
  // trailing dot is the same DNS name
  if (parsed.host.size() > 1 && parsed.host.back() == '.') {
    parsed.host.pop_back();
  }

  if (parsed.explicit_port) {
    int port_value = 0;
    auto result    = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port_value);
    if (port_view.empty() || result.ec != std::errc{} || result.ptr != port_view.data() + port_view.size() || port_value <= 0 ||
        port_value > 65535) {
      throw util::ValidationError("invalid port");
    }
    parsed.port = static_cast<uint16_t>(port_value);
  }

  return parsed;
}

std::string ResolveLocation(const ParsedUrl& base, std::string_view location) {
  if (location.find("://") != std::string_view::npos) {
    return std::string(location);
  }
  if (location.substr(0, 2) == "//") {
    return base.scheme + ":" + std::string(location);
  }

  std::string origin = base.scheme + "://" + base.HostForUrl();
  if (base.explicit_port) {
    origin += ":" + std::to_string(base.port);
  }

  if (!location.empty() && location.front() == '/') {
    return origin + std::string(location);
  }

  // relative to the directory of the current path
  auto path = base.target.substr(0, base.target.find('?'));
  auto dir  = path.substr(0, path.rfind('/') + 1);
  return origin + dir + std::string(location);
}

bool HasHttpScheme(std::string_view url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) return false;
  auto scheme = Lower(url.substr(0, scheme_end));
  return scheme == "http" || scheme == "https";
}

} // namespace framecomp::net
