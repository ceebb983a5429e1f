#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/feed/feed_parser.hpp"
#include "internal/net/fetcher.hpp"

namespace framecomp::feed {

/*
  fetch_and_parse over a net::Fetcher.

  Transport failures and non-2xx responses surface as util::FeedError.
  util::ValidationError (blocked URL, wrong content type, oversized body)
  passes through unchanged.

  With a non-zero ttl, parsed outcomes are cached per URL.
*/
class FeedFetcher {
 public:
  FeedFetcher(std::shared_ptr<net::Fetcher> fetcher, std::chrono::milliseconds cache_ttl = std::chrono::milliseconds{0});

  std::vector<ParseOutcome> FetchAndParse(const std::string& feed_url);

  void ClearCache();

 private:
  struct CacheEntry {
    std::chrono::steady_clock::time_point expires_at;
    std::vector<ParseOutcome>             outcomes;
  };

  std::shared_ptr<net::Fetcher> fetcher_;
  std::chrono::milliseconds     cache_ttl_;

  std::mutex                                  mutex_;
  std::unordered_map<std::string, CacheEntry> cache_;
};

} // namespace framecomp::feed
