#pragma once

#include <string>

namespace framecomp::net {

enum class ContentKind {
  kFeed,
  kImage,
};

struct FetchResponse {
  std::string body;
  std::string content_type;
  // after redirects
  std::string final_url;
};

/*
  Outbound GET seam.

  Throws util::ValidationError when the URL, a redirect target, the
  content type or the size violates policy, and util::FetchError on
  transport failure, timeout or a non-2xx status.
*/
class Fetcher {
 public:
  virtual ~Fetcher() = default;

  virtual FetchResponse Fetch(const std::string& url, ContentKind kind) = 0;
};

} // namespace framecomp::net
