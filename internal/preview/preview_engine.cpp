#include "internal/preview/preview_engine.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

#include "internal/image/image_codec.hpp"
#include "internal/util/errors.hpp"

namespace framecomp::preview {

PreviewEngine::PreviewEngine(std::shared_ptr<image::Compositor> compositor,
                             std::shared_ptr<net::Fetcher>      fetcher,
                             std::shared_ptr<feed::FeedFetcher> feeds,
                             PreviewOptions                     options)
    : compositor_(std::move(compositor)), fetcher_(std::move(fetcher)), feeds_(std::move(feeds)), options_(options) {
}

PreviewImage PreviewEngine::Render(const image::FrameTemplate& frame, const image::OverlayRect& rect, const ProductImageRef& ref) const {
  image::ValidateRect(rect, frame.Width(), frame.Height());

  PreviewImage out;
  std::string  product_bytes;

  if (const auto* inline_image = std::get_if<InlineImage>(&ref)) {
    product_bytes = inline_image->bytes;
  } else if (const auto* url = std::get_if<ImageUrl>(&ref)) {
    product_bytes = fetcher_->Fetch(url->url, net::ContentKind::kImage).body;
  } else {
    const auto& source = std::get<FromFeed>(ref);
    if (source.feed_url.empty()) {
      throw util::ConfigurationError("no product image given and the project has no feed url");
    }
    auto records = feed::OkRecords(feeds_->FetchAndParse(source.feed_url));
    if (records.empty()) {
      throw util::FeedError("feed has no usable items for preview");
    }
    out.product_id = records.front().product_id;
    product_bytes  = fetcher_->Fetch(records.front().image_url, net::ContentKind::kImage).body;
  }

  cv::Mat rendered = FitPreview(compositor_->Composite(frame, rect, product_bytes));

  out.bytes     = image::Encode(rendered, frame.format, options_.quality);
  out.format    = frame.format;
  out.mime_type = image::MimeType(frame.format);
  out.width     = static_cast<uint32_t>(rendered.cols);
  out.height    = static_cast<uint32_t>(rendered.rows);
  return out;
}

cv::Mat PreviewEngine::FitPreview(const cv::Mat& composite) const {
  double scale = 1.0;
  if (options_.max_width > 0 && static_cast<uint32_t>(composite.cols) > options_.max_width) {
    scale = std::min(scale, static_cast<double>(options_.max_width) / composite.cols);
  }
  if (options_.max_height > 0 && static_cast<uint32_t>(composite.rows) > options_.max_height) {
    scale = std::min(scale, static_cast<double>(options_.max_height) / composite.rows);
  }
  if (scale >= 1.0) {
    return composite;
  }

  const int w = std::max(1, static_cast<int>(std::floor(composite.cols * scale)));
  const int h = std::max(1, static_cast<int>(std::floor(composite.rows * scale)));

  cv::Mat resized;
  cv::resize(composite, resized, cv::Size(w, h), 0, 0, cv::INTER_AREA);
  return resized;
}

} // namespace framecomp::preview
