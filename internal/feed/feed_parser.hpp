#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace framecomp::feed {

struct ProductRecord {
  std::string product_id;
  std::string image_url;
  // remaining leaf children keyed by local name (title, link, price, ...)
  std::map<std::string, std::string> attributes;
};

struct SkippedItem {
  // zero-based position among recognized items
  std::size_t index = 0;
  std::string reason;
};

using ParseOutcome = std::variant<ProductRecord, SkippedItem>;

/*
  Parses an Atom or RSS product feed.

  Every <entry> / <item> element (matched by local name, document order)
  yields one outcome. An item without a product id or image link is
  Skipped; unknown elements are ignored. Throws util::FeedError when the
  document itself is not well-formed XML.
*/
std::vector<ParseOutcome> ParseFeed(std::string_view xml);

// Convenience filters over ParseFeed output.
std::vector<ProductRecord> OkRecords(const std::vector<ParseOutcome>& outcomes);
std::vector<SkippedItem>   SkippedItems(const std::vector<ParseOutcome>& outcomes);

} // namespace framecomp::feed
