#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/net/fetcher.hpp"
#include "internal/net/url_validator.hpp"

namespace framecomp::net {

struct FetchOptions {
  std::chrono::milliseconds timeout{10000};
  uint64_t                  max_feed_bytes  = 50ull * 1024 * 1024;
  uint64_t                  max_image_bytes = 10ull * 1024 * 1024;
  uint32_t                  max_redirects   = 3;
  std::string               user_agent{"frame-compositor/0.1"};
};

/*
  cpp-httplib backed fetcher.

  Each hop is validated, then the connection is pinned to the validated
  address so DNS cannot be re-asked between check and connect. Redirects
  are followed by hand so every Location goes through the validator.
*/
class HttpFetcher final : public Fetcher {
 public:
  HttpFetcher(std::shared_ptr<UrlValidator> validator, FetchOptions options);

  FetchResponse Fetch(const std::string& url, ContentKind kind) override;

 private:
  std::shared_ptr<UrlValidator> validator_;
  FetchOptions                  options_;
};

// Content-type acceptance, exposed for tests.
bool AcceptsContentType(ContentKind kind, const std::string& content_type);

} // namespace framecomp::net
