#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

#include "internal/feed/feed_fetcher.hpp"
#include "internal/image/compositor.hpp"
#include "internal/net/fetcher.hpp"

namespace framecomp::preview {

struct InlineImage {
  std::string bytes;
};

struct ImageUrl {
  std::string url;
};

// Use the first usable item of this feed.
struct FromFeed {
  std::string feed_url;
};

using ProductImageRef = std::variant<InlineImage, ImageUrl, FromFeed>;

struct PreviewOptions {
  // 0 disables downscaling along that axis
  uint32_t max_width  = 800;
  uint32_t max_height = 600;
  int      quality    = 75;
};

struct PreviewImage {
  std::string                bytes;
  framecomp::v1::ImageFormat format = framecomp::v1::IMAGE_FORMAT_UNSPECIFIED;
  std::string                mime_type;
  uint32_t                   width  = 0;
  uint32_t                   height = 0;
  // set when the image was taken from the feed
  std::string                product_id;
};

/*
  Single-item render for tuning the overlay rect. Pure apart from the
  validator-gated fetches; never touches the output store.
*/
class PreviewEngine {
 public:
  PreviewEngine(std::shared_ptr<image::Compositor> compositor,
                std::shared_ptr<net::Fetcher>      fetcher,
                std::shared_ptr<feed::FeedFetcher> feeds,
                PreviewOptions                     options);

  PreviewImage Render(const image::FrameTemplate& frame, const image::OverlayRect& rect, const ProductImageRef& ref) const;

 private:
  cv::Mat FitPreview(const cv::Mat& composite) const;

  std::shared_ptr<image::Compositor> compositor_;
  std::shared_ptr<net::Fetcher>      fetcher_;
  std::shared_ptr<feed::FeedFetcher> feeds_;
  PreviewOptions                     options_;
};

} // namespace framecomp::preview
