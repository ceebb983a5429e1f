#include <cassert>
#include <iostream>
#include <string>
#include <variant>

#include "internal/feed/feed_parser.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using framecomp::feed::OkRecords;
using framecomp::feed::ParseFeed;
using framecomp::feed::ProductRecord;
using framecomp::feed::SkippedItem;
using framecomp::feed::SkippedItems;

void TestAtomFeedWithNamespacedFields() {
  auto outcomes = ParseFeed(framecomp::testing::AtomFeed({
      {"sku-1", "https://cdn.example.com/1.jpg"},
      {"sku-2", "https://cdn.example.com/2.png"},
  }));

  assert(outcomes.size() == 2);
  auto records = OkRecords(outcomes);
  assert(records.size() == 2);
  assert(records[0].product_id == "sku-1");
  assert(records[0].image_url == "https://cdn.example.com/1.jpg");
  assert(records[0].attributes.at("title") == "product sku-1");
  assert(records[1].product_id == "sku-2");
}

void TestRssFeed() {
  const char* xml = R"(<?xml version="1.0"?>
<rss version="2.0" xmlns:g="http://base.google.com/ns/1.0">
  <channel>
    <title>shop</title>
    <item>
      <g:id>  A-100 </g:id>
      <title>Lamp</title>
      <g:price>19.99 EUR</g:price>
      <g:image_link>
        https://cdn.example.com/lamp.webp
      </g:image_link>
    </item>
  </channel>
</rss>)";

  auto records = OkRecords(ParseFeed(xml));
  assert(records.size() == 1);
  assert(records[0].product_id == "A-100");
  assert(records[0].image_url == "https://cdn.example.com/lamp.webp");
  assert(records[0].attributes.at("price") == "19.99 EUR");
  assert(records[0].attributes.at("title") == "Lamp");
}

void TestIncompleteItemsAreSkippedInPlace() {
  auto outcomes = ParseFeed(framecomp::testing::AtomFeed({
      {"sku-1", "https://cdn.example.com/1.jpg"},
      {"", "https://cdn.example.com/orphan.jpg"},
      {"sku-3", ""},
      {"sku-4", "https://cdn.example.com/4.jpg"},
  }));

  assert(outcomes.size() == 4);
  assert(std::holds_alternative<ProductRecord>(outcomes[0]));
  assert(std::holds_alternative<SkippedItem>(outcomes[1]));
  assert(std::holds_alternative<SkippedItem>(outcomes[2]));
  assert(std::holds_alternative<ProductRecord>(outcomes[3]));

  auto skipped = SkippedItems(outcomes);
  assert(skipped.size() == 2);
  assert(skipped[0].index == 1);
  assert(skipped[0].reason == "missing product id");
  assert(skipped[1].index == 2);
  assert(skipped[1].reason.find("sku-3") != std::string::npos);
}

void TestFirstIdWins() {
  const char* xml = R"(<feed xmlns:g="http://base.google.com/ns/1.0">
  <entry><g:id>first</g:id><id>second</id><g:image_link>https://x.example.com/a.png</g:image_link></entry>
</feed>)";
  auto records = OkRecords(ParseFeed(xml));
  assert(records.size() == 1);
  assert(records[0].product_id == "first");
}

void TestEmptyFeedHasNoItems() {
  auto outcomes = ParseFeed("<feed><title>nothing here</title></feed>");
  assert(outcomes.empty());
}

void TestMalformedXmlThrows() {
  const char* inputs[] = {
      "<feed><entry><g:id>1</g:id></feed>",
      "not xml at all",
      "",
  };
  for (const char* input : inputs) {
    bool threw = false;
    try {
      ParseFeed(input);
    } catch (const framecomp::util::FeedError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestDoctypeIsNotExpanded() {
  const char* xml = R"(<?xml version="1.0"?>
<!DOCTYPE feed [<!ENTITY xxe SYSTEM "file:///etc/passwd">]>
<feed><entry><id>sku</id><image_link>https://cdn.example.com/a.jpg</image_link><title>&xxe;</title></entry></feed>)";

  std::string leaked;
  try {
    auto records = OkRecords(ParseFeed(xml));
    for (const auto& record : records) {
      auto it = record.attributes.find("title");
      if (it != record.attributes.end()) leaked = it->second;
    }
  } catch (const framecomp::util::FeedError&) {
    // rejecting the document outright is also safe
  }
  assert(leaked.find("root:") == std::string::npos);
}

} // namespace

int main() {
  TestAtomFeedWithNamespacedFields();
  TestRssFeed();
  TestIncompleteItemsAreSkippedInPlace();
  TestFirstIdWins();
  TestEmptyFeedHasNoItems();
  TestMalformedXmlThrows();
  TestDoctypeIsNotExpanded();

  std::cout << "framecomp_unit_feed_parser: pass\n";
  return 0;
}
