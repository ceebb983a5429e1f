#include "internal/feed/feed_parser.hpp"

#include <pugixml.hpp>

#include <cctype>

#include "internal/util/errors.hpp"

namespace framecomp::feed {

namespace {

std::string_view LocalName(const pugi::xml_node& node) {
  std::string_view name = node.name();
  auto             colon = name.rfind(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

bool IsItemElement(const pugi::xml_node& node) {
  if (node.type() != pugi::node_element) return false;
  auto local = LocalName(node);
  return local == "entry" || local == "item";
}

std::string Trimmed(const char* text) {
  std::string_view view(text);
  while (!view.empty() && std::isspace(static_cast<unsigned char>(view.front()))) view.remove_prefix(1);
  while (!view.empty() && std::isspace(static_cast<unsigned char>(view.back()))) view.remove_suffix(1);
  return std::string(view);
}

void CollectItems(const pugi::xml_node& node, std::vector<pugi::xml_node>& items) {
  for (pugi::xml_node child : node.children()) {
    if (IsItemElement(child)) {
      items.push_back(child);
      continue;
    }
    CollectItems(child, items);
  }
}

ParseOutcome ParseItem(const pugi::xml_node& item, std::size_t index) {
  ProductRecord record;

  for (pugi::xml_node child : item.children()) {
    if (child.type() != pugi::node_element) continue;

    auto local = LocalName(child);
    auto text  = Trimmed(child.text().get());

    if (local == "id") {
      if (record.product_id.empty()) record.product_id = std::move(text);
    } else if (local == "image_link") {
      if (record.image_url.empty()) record.image_url = std::move(text);
    } else if (!text.empty() && !child.first_child().first_child()) {
      record.attributes.emplace(std::string(local), std::move(text));
    }
  }

  if (record.product_id.empty()) {
    return SkippedItem{index, "missing product id"};
  }
  if (record.image_url.empty()) {
    return SkippedItem{index, "missing image link for product " + record.product_id};
  }
  return record;
}

} // namespace

std::vector<ParseOutcome> ParseFeed(std::string_view xml) {
  pugi::xml_document document;

  // no DOCTYPE processing
  unsigned int flags  = pugi::parse_default & ~pugi::parse_doctype;
  auto         result = document.load_buffer(xml.data(), xml.size(), flags, pugi::encoding_utf8);
  if (!result) {
    throw util::FeedError(std::string("malformed feed XML at offset ") + std::to_string(result.offset) + ": " + result.description());
  }
  if (!document.document_element()) {
    throw util::FeedError("feed has no root element");
  }

  std::vector<pugi::xml_node> items;
  CollectItems(document, items);

  std::vector<ParseOutcome> outcomes;
  outcomes.reserve(items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    outcomes.push_back(ParseItem(items[i], i));
  }
  return outcomes;
}

std::vector<ProductRecord> OkRecords(const std::vector<ParseOutcome>& outcomes) {
  std::vector<ProductRecord> records;
  for (const auto& outcome : outcomes) {
    if (const auto* record = std::get_if<ProductRecord>(&outcome)) records.push_back(*record);
  }
  return records;
}

std::vector<SkippedItem> SkippedItems(const std::vector<ParseOutcome>& outcomes) {
  std::vector<SkippedItem> skipped;
  for (const auto& outcome : outcomes) {
    if (const auto* item = std::get_if<SkippedItem>(&outcome)) skipped.push_back(*item);
  }
  return skipped;
}

} // namespace framecomp::feed
