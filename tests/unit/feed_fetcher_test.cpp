#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/feed/feed_fetcher.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using framecomp::feed::FeedFetcher;
using framecomp::feed::OkRecords;
using framecomp::testing::AtomFeed;
using framecomp::testing::FakeFetcher;

const std::string kFeedUrl = "https://feeds.example.com/catalog.xml";

void TestFetchAndParse() {
  auto http = std::make_shared<FakeFetcher>();
  http->Serve(kFeedUrl, AtomFeed({{"a", "https://cdn.example.com/a.jpg"}, {"b", ""}}), "application/atom+xml");

  FeedFetcher feeds(http);
  auto        outcomes = feeds.FetchAndParse(kFeedUrl);
  assert(outcomes.size() == 2);
  assert(OkRecords(outcomes).size() == 1);

  // no cache by default
  feeds.FetchAndParse(kFeedUrl);
  assert(http->Calls(kFeedUrl) == 2);
}

void TestTransportFailureBecomesFeedError() {
  auto http = std::make_shared<FakeFetcher>();
  http->Fail(kFeedUrl, FakeFetcher::Failure::kFetch);

  FeedFetcher feeds(http);
  bool        threw = false;
  try {
    feeds.FetchAndParse(kFeedUrl);
  } catch (const framecomp::util::FeedError& e) {
    threw = std::string(e.what()).find("feed fetch failed") != std::string::npos;
  }
  assert(threw);
}

void TestPolicyRejectionPassesThrough() {
  auto http = std::make_shared<FakeFetcher>();
  http->Fail(kFeedUrl, FakeFetcher::Failure::kValidation);

  FeedFetcher feeds(http);
  bool        threw = false;
  try {
    feeds.FetchAndParse(kFeedUrl);
  } catch (const framecomp::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedBodyIsFeedError() {
  auto http = std::make_shared<FakeFetcher>();
  http->Serve(kFeedUrl, "<feed><entry>", "text/xml");

  FeedFetcher feeds(http);
  bool        threw = false;
  try {
    feeds.FetchAndParse(kFeedUrl);
  } catch (const framecomp::util::FeedError&) {
    threw = true;
  }
  assert(threw);
}

void TestCacheHonoursTtl() {
  auto http = std::make_shared<FakeFetcher>();
  http->Serve(kFeedUrl, AtomFeed({{"a", "https://cdn.example.com/a.jpg"}}), "text/xml");

  FeedFetcher feeds(http, std::chrono::milliseconds(60000));
  feeds.FetchAndParse(kFeedUrl);
  feeds.FetchAndParse(kFeedUrl);
  assert(http->Calls(kFeedUrl) == 1);

  feeds.ClearCache();
  feeds.FetchAndParse(kFeedUrl);
  assert(http->Calls(kFeedUrl) == 2);

  // failures are not cached
  http->Fail(kFeedUrl, FakeFetcher::Failure::kFetch);
  feeds.ClearCache();
  bool threw = false;
  try {
    feeds.FetchAndParse(kFeedUrl);
  } catch (const framecomp::util::FeedError&) {
    threw = true;
  }
  assert(threw);
  http->Serve(kFeedUrl, AtomFeed({{"b", "https://cdn.example.com/b.jpg"}}), "text/xml");
  auto records = OkRecords(feeds.FetchAndParse(kFeedUrl));
  assert(records.size() == 1);
  assert(records[0].product_id == "b");
}

} // namespace

int main() {
  TestFetchAndParse();
  TestTransportFailureBecomesFeedError();
  TestPolicyRejectionPassesThrough();
  TestMalformedBodyIsFeedError();
  TestCacheHonoursTtl();

  std::cout << "framecomp_unit_feed_fetcher: pass\n";
  return 0;
}
