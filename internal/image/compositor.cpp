#include "internal/image/compositor.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

#include "internal/image/image_codec.hpp"
#include "internal/util/errors.hpp"

namespace framecomp::image {

using util::CompositeError;

namespace {

void RequireSourceDimensions(uint32_t w, uint32_t h, const CompositorOptions& options) {
  if (w < options.min_source_dimension || h < options.min_source_dimension || w > options.max_source_dimension ||
      h > options.max_source_dimension) {
    throw CompositeError(CompositeError::Kind::kUnsupportedDimensions,
                         "product image " + std::to_string(w) + "x" + std::to_string(h) + " outside " +
                             std::to_string(options.min_source_dimension) + ".." + std::to_string(options.max_source_dimension));
  }
}

void RequireTemplateDimensions(uint32_t w, uint32_t h, const CompositorOptions& options) {
  if (w < 1 || h < 1 || w > options.max_template_dimension || h > options.max_template_dimension) {
    throw util::ConfigurationError("template dimensions " + std::to_string(w) + "x" + std::to_string(h) + " outside 1.." +
                                   std::to_string(options.max_template_dimension));
  }
}

} // namespace

FrameTemplate DecodeTemplate(std::string_view bytes) {
  auto format = DetectFormat(bytes);
  if (format == v1::IMAGE_FORMAT_UNSPECIFIED) {
    throw util::ConfigurationError("template must be JPEG, PNG or WebP");
  }

  FrameTemplate frame;
  try {
    frame.pixels = Decode(bytes);
  } catch (const CompositeError& e) {
    throw util::ConfigurationError(std::string("template does not decode: ") + e.what());
  }
  frame.format = format;
  return frame;
}

FrameTemplate LoadTemplate(std::string_view bytes, const CompositorOptions& options) {
  if (bytes.empty()) {
    throw util::ConfigurationError("template image is empty");
  }
  if (bytes.size() > options.max_template_bytes) {
    throw util::ConfigurationError("template image exceeds " + std::to_string(options.max_template_bytes) + " bytes");
  }

  // reject oversized declarations before the decoder allocates for them
  if (auto declared = PeekDimensions(bytes)) {
    RequireTemplateDimensions(declared->width, declared->height, options);
  }

  auto frame = DecodeTemplate(bytes);
  RequireTemplateDimensions(frame.Width(), frame.Height(), options);
  return frame;
}

void ValidateRect(const OverlayRect& rect, uint32_t width, uint32_t height) {
  if (rect.width < 1 || rect.height < 1) {
    throw util::BoundsError("overlay rect must have width and height of at least 1");
  }
  // 64-bit sums so huge coordinates cannot wrap
  if (uint64_t{rect.x} + rect.width > width || uint64_t{rect.y} + rect.height > height) {
    throw util::BoundsError("overlay rect (" + std::to_string(rect.x) + "," + std::to_string(rect.y) + "," + std::to_string(rect.width) +
                            "," + std::to_string(rect.height) + ") exceeds template " + std::to_string(width) + "x" +
                            std::to_string(height));
  }
}

cv::Mat CoverFit(const cv::Mat& source, int width, int height) {
  const double scale = std::max(static_cast<double>(width) / source.cols, static_cast<double>(height) / source.rows);

  const int scaled_w = std::max(width, static_cast<int>(std::ceil(source.cols * scale - 1e-9)));
  const int scaled_h = std::max(height, static_cast<int>(std::ceil(source.rows * scale - 1e-9)));

  cv::Mat scaled;
  if (scaled_w == source.cols && scaled_h == source.rows) {
    scaled = source;
  } else {
    const int interpolation = scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR;
    cv::resize(source, scaled, cv::Size(scaled_w, scaled_h), 0, 0, interpolation);
  }

  const int left = (scaled_w - width) / 2;
  const int top  = (scaled_h - height) / 2;
  return scaled(cv::Rect(left, top, width, height)).clone();
}

std::string Compositor::Compose(const FrameTemplate& frame, const OverlayRect& rect, std::string_view product_bytes) const {
  return Encode(Composite(frame, rect, product_bytes), frame.format, OutputQuality());
}

OpenCvCompositor::OpenCvCompositor(CompositorOptions options) : options_(options) {
}

cv::Mat OpenCvCompositor::Composite(const FrameTemplate& frame, const OverlayRect& rect, std::string_view product_bytes) const {
  // only headers we can size are handed to the decoder
  auto declared = PeekDimensions(product_bytes);
  if (!declared) {
    throw CompositeError(CompositeError::Kind::kDecodeFailed, "product image is not a readable JPEG, PNG or WebP");
  }
  RequireSourceDimensions(declared->width, declared->height, options_);

  cv::Mat product = Decode(product_bytes);
  RequireSourceDimensions(static_cast<uint32_t>(product.cols), static_cast<uint32_t>(product.rows), options_);

  cv::Mat fitted = CoverFit(product, static_cast<int>(rect.width), static_cast<int>(rect.height));

  cv::Mat canvas = frame.pixels.clone();
  fitted.copyTo(canvas(cv::Rect(static_cast<int>(rect.x), static_cast<int>(rect.y), static_cast<int>(rect.width),
                                static_cast<int>(rect.height))));
  return canvas;
}

} // namespace framecomp::image
