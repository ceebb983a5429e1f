#include "internal/net/http_fetcher.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace framecomp::net {

namespace {

std::string MediaType(const std::string& content_type) {
  auto semicolon = content_type.find(';');
  std::string media = content_type.substr(0, semicolon);
  media.erase(media.begin(), std::find_if(media.begin(), media.end(), [](unsigned char c) { return !std::isspace(c); }));
  media.erase(std::find_if(media.rbegin(), media.rend(), [](unsigned char c) { return !std::isspace(c); }).base(), media.end());
  std::transform(media.begin(), media.end(), media.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return media;
}

std::unique_ptr<httplib::ClientImpl> MakeClient(const ValidationResult& hop, const FetchOptions& options) {
  std::unique_ptr<httplib::ClientImpl> client;
  if (hop.url.tls) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    auto ssl_client = std::make_unique<httplib::SSLClient>(hop.url.host, hop.url.port);
    ssl_client->enable_server_certificate_verification(true);
    client = std::unique_ptr<httplib::ClientImpl>(std::move(ssl_client));
#else
    throw util::FetchError("https is not supported by this build");
#endif
  } else {
    client = std::make_unique<httplib::ClientImpl>(hop.url.host, hop.url.port);
  }

  // connect to the address that passed validation, not a fresh lookup
  client->set_hostname_addr_map({{hop.url.host, hop.pinned.ToString()}});
  client->set_connection_timeout(options.timeout);
  client->set_read_timeout(options.timeout);
  client->set_write_timeout(options.timeout);
  client->set_follow_location(false);
  client->set_keep_alive(false);
  return client;
}

} // namespace

bool AcceptsContentType(ContentKind kind, const std::string& content_type) {
  auto media = MediaType(content_type);
  if (media.empty()) {
    return true;
  }
  if (kind == ContentKind::kFeed) {
    return media.find("xml") != std::string::npos;
  }
  return media == "image/jpeg" || media == "image/jpg" || media == "image/png" || media == "image/webp";
}

HttpFetcher::HttpFetcher(std::shared_ptr<UrlValidator> validator, FetchOptions options)
    : validator_(std::move(validator)), options_(std::move(options)) {
}

FetchResponse HttpFetcher::Fetch(const std::string& url, ContentKind kind) {
  const uint64_t limit  = kind == ContentKind::kFeed ? options_.max_feed_bytes : options_.max_image_bytes;
  const char*    accept = kind == ContentKind::kFeed ? "application/xml, text/xml, */*" : "image/*";

  std::string current = url;
  for (uint32_t hop_count = 0;; ++hop_count) {
    auto hop    = validator_->Require(current);
    auto client = MakeClient(hop, options_);

    httplib::Headers headers{{"Accept", accept}, {"User-Agent", options_.user_agent}};

    int                        status = 0;
    std::string                content_type;
    std::optional<std::string> location;
    std::optional<std::string> violation;
    std::string                body;

    auto on_response = [&](const httplib::Response& response) {
      status = response.status;
      if (status >= 300 && status < 400) {
        if (response.has_header("Location")) location = response.get_header_value("Location");
        return false;
      }
      if (status < 200 || status >= 300) {
        return false;
      }

      content_type = response.get_header_value("Content-Type");
      if (!AcceptsContentType(kind, content_type)) {
        violation = "unexpected content type: " + content_type;
        return false;
      }
      if (response.has_header("Content-Length")) {
        auto declared = std::strtoull(response.get_header_value("Content-Length").c_str(), nullptr, 10);
        if (declared > limit) {
          violation = "response too large: " + std::to_string(declared) + " bytes";
          return false;
        }
      }
      return true;
    };

    auto on_content = [&](const char* data, size_t length) {
      if (body.size() + length > limit) {
        violation = "response exceeds " + std::to_string(limit) + " bytes";
        return false;
      }
      body.append(data, length);
      return true;
    };

    auto result = client->Get(hop.url.target, headers, on_response, on_content);

    if (violation) {
      FRAMECOMP_LOG_WARN("fetch rejected", {observability::StringField("url", current), observability::StringField("reason", *violation)});
      throw util::ValidationError(*violation);
    }

    if (status >= 300 && status < 400) {
      if (!location || location->empty()) {
        throw util::FetchError("redirect without Location from " + current);
      }
      if (hop_count + 1 > options_.max_redirects) {
        throw util::FetchError("too many redirects fetching " + url);
      }
      current = ResolveLocation(hop.url, *location);
      continue;
    }

    if (status != 0 && (status < 200 || status >= 300)) {
      throw util::FetchError("HTTP " + std::to_string(status) + " from " + current);
    }

    if (!result) {
      throw util::FetchError("request to " + current + " failed: " + httplib::to_string(result.error()));
    }

    return FetchResponse{std::move(body), std::move(content_type), current};
  }
}

} // namespace framecomp::net
