#include "internal/feed/feed_fetcher.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace framecomp::feed {

using observability::IntField;
using observability::StringField;

FeedFetcher::FeedFetcher(std::shared_ptr<net::Fetcher> fetcher, std::chrono::milliseconds cache_ttl)
    : fetcher_(std::move(fetcher)), cache_ttl_(cache_ttl) {
}

std::vector<ParseOutcome> FeedFetcher::FetchAndParse(const std::string& feed_url) {
  const bool caching = cache_ttl_.count() > 0;

  if (caching) {
    std::lock_guard lock(mutex_);
    auto            it = cache_.find(feed_url);
    if (it != cache_.end()) {
      if (it->second.expires_at > std::chrono::steady_clock::now()) {
        return it->second.outcomes;
      }
      cache_.erase(it);
    }
  }

  net::FetchResponse response;
  try {
    response = fetcher_->Fetch(feed_url, net::ContentKind::kFeed);
  } catch (const util::FetchError& e) {
    throw util::FeedError(std::string("feed fetch failed: ") + e.what());
  }

  auto outcomes = ParseFeed(response.body);

  FRAMECOMP_LOG_INFO("feed parsed", {StringField("url", response.final_url),
                                     IntField("items", static_cast<int64_t>(outcomes.size())),
                                     IntField("skipped", static_cast<int64_t>(SkippedItems(outcomes).size()))});

  if (caching) {
    std::lock_guard lock(mutex_);
    cache_[feed_url] = CacheEntry{std::chrono::steady_clock::now() + cache_ttl_, outcomes};
  }
  return outcomes;
}

void FeedFetcher::ClearCache() {
  std::lock_guard lock(mutex_);
  cache_.clear();
}

} // namespace framecomp::feed
