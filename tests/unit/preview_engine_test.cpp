#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/feed/feed_fetcher.hpp"
#include "internal/image/compositor.hpp"
#include "internal/image/image_codec.hpp"
#include "internal/preview/preview_engine.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using framecomp::image::CompositorOptions;
using framecomp::image::LoadTemplate;
using framecomp::image::OpenCvCompositor;
using framecomp::image::OverlayRect;
using framecomp::preview::FromFeed;
using framecomp::preview::ImageUrl;
using framecomp::preview::InlineImage;
using framecomp::preview::PreviewEngine;
using framecomp::preview::PreviewOptions;
using framecomp::testing::AtomFeed;
using framecomp::testing::FakeFetcher;
using framecomp::testing::SolidImage;

const cv::Scalar kBlue(255, 0, 0);
const cv::Scalar kRed(0, 0, 255);

struct Fixture {
  std::shared_ptr<FakeFetcher>   http = std::make_shared<FakeFetcher>();
  std::shared_ptr<PreviewEngine> engine;

  explicit Fixture(PreviewOptions options = {}) {
    engine = std::make_shared<PreviewEngine>(std::make_shared<OpenCvCompositor>(CompositorOptions{}), http,
                                             std::make_shared<framecomp::feed::FeedFetcher>(http), options);
  }
};

void TestInlineImageIsDeterministic() {
  Fixture fx;
  auto    frame   = LoadTemplate(SolidImage(800, 600, kBlue), CompositorOptions{});
  auto    product = SolidImage(400, 300, kRed);

  auto first  = fx.engine->Render(frame, OverlayRect{50, 50, 200, 150}, InlineImage{product});
  auto second = fx.engine->Render(frame, OverlayRect{50, 50, 200, 150}, InlineImage{product});

  assert(first.width == 800 && first.height == 600);
  assert(first.mime_type == "image/png");
  assert(first.format == framecomp::v1::IMAGE_FORMAT_PNG);
  assert(first.product_id.empty());
  assert(first.bytes == second.bytes);
  assert(fx.http->TotalCalls() == 0);

  auto decoded = framecomp::image::Decode(first.bytes);
  assert(decoded.at<cv::Vec3b>(100, 100) == cv::Vec3b(0, 0, 255));
  assert(decoded.at<cv::Vec3b>(10, 10) == cv::Vec3b(255, 0, 0));
}

void TestLargeTemplatesAreDownscaled() {
  Fixture fx(PreviewOptions{.max_width = 800, .max_height = 600, .quality = 75});
  auto    frame = LoadTemplate(SolidImage(1600, 1200, kBlue), CompositorOptions{});

  auto preview = fx.engine->Render(frame, OverlayRect{0, 0, 100, 100}, InlineImage{SolidImage(50, 50, kRed)});
  assert(preview.width == 800);
  assert(preview.height == 600);

  auto decoded = framecomp::image::Decode(preview.bytes);
  assert(decoded.cols == 800 && decoded.rows == 600);
}

void TestImageUrlIsFetched() {
  Fixture fx;
  fx.http->Serve("https://cdn.example.com/p.png", SolidImage(40, 40, kRed), "image/png");
  auto frame = LoadTemplate(SolidImage(200, 200, kBlue), CompositorOptions{});

  auto preview = fx.engine->Render(frame, OverlayRect{10, 10, 20, 20}, ImageUrl{"https://cdn.example.com/p.png"});
  assert(preview.width == 200);
  assert(fx.http->Calls("https://cdn.example.com/p.png") == 1);

  bool failed = false;
  try {
    fx.engine->Render(frame, OverlayRect{10, 10, 20, 20}, ImageUrl{"https://cdn.example.com/missing.png"});
  } catch (const framecomp::util::FetchError&) {
    failed = true;
  }
  assert(failed);
}

void TestFeedSourceUsesFirstUsableItem() {
  Fixture fx;
  const std::string feed_url = "https://feeds.example.com/f.xml";
  fx.http->Serve(feed_url,
                 AtomFeed({{"", "https://cdn.example.com/none.png"},
                           {"sku-2", "https://cdn.example.com/2.png"},
                           {"sku-3", "https://cdn.example.com/3.png"}}),
                 "application/xml");
  fx.http->Serve("https://cdn.example.com/2.png", SolidImage(40, 40, kRed), "image/png");
  auto frame = LoadTemplate(SolidImage(200, 200, kBlue), CompositorOptions{});

  auto preview = fx.engine->Render(frame, OverlayRect{0, 0, 50, 50}, FromFeed{feed_url});
  assert(preview.product_id == "sku-2");
  assert(fx.http->Calls("https://cdn.example.com/3.png") == 0);

  fx.http->Serve(feed_url, AtomFeed({{"", ""}}), "application/xml");
  bool empty = false;
  try {
    fx.engine->Render(frame, OverlayRect{0, 0, 50, 50}, FromFeed{feed_url});
  } catch (const framecomp::util::FeedError&) {
    empty = true;
  }
  assert(empty);

  bool no_feed = false;
  try {
    fx.engine->Render(frame, OverlayRect{0, 0, 50, 50}, FromFeed{""});
  } catch (const framecomp::util::ConfigurationError&) {
    no_feed = true;
  }
  assert(no_feed);
}

void TestBadRectFailsBeforeAnyFetch() {
  Fixture fx;
  auto    frame = LoadTemplate(SolidImage(200, 200, kBlue), CompositorOptions{});

  bool threw = false;
  try {
    fx.engine->Render(frame, OverlayRect{150, 150, 100, 100}, ImageUrl{"https://cdn.example.com/p.png"});
  } catch (const framecomp::util::BoundsError&) {
    threw = true;
  }
  assert(threw);
  assert(fx.http->TotalCalls() == 0);
}

} // namespace

int main() {
  TestInlineImageIsDeterministic();
  TestLargeTemplatesAreDownscaled();
  TestImageUrlIsFetched();
  TestFeedSourceUsesFirstUsableItem();
  TestBadRectFailsBeforeAnyFetch();

  std::cout << "framecomp_unit_preview_engine: pass\n";
  return 0;
}
