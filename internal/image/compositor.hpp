#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include "framecomp/v1/types.pb.h"

namespace framecomp::image {

struct OverlayRect {
  uint32_t x      = 0;
  uint32_t y      = 0;
  uint32_t width  = 0;
  uint32_t height = 0;
};

// A decoded, validated frame template.
struct FrameTemplate {
  cv::Mat                    pixels;
  framecomp::v1::ImageFormat format = framecomp::v1::IMAGE_FORMAT_UNSPECIFIED;

  uint32_t Width() const {
    return static_cast<uint32_t>(pixels.cols);
  }
  uint32_t Height() const {
    return static_cast<uint32_t>(pixels.rows);
  }
};

struct CompositorOptions {
  int      output_quality         = 85;
  uint32_t min_source_dimension   = 10;
  uint32_t max_source_dimension   = 4000;
  uint64_t max_template_bytes     = 10ull * 1024 * 1024;
  uint32_t max_template_dimension = 8000;
};

/*
  Decode a stored template without the size limits applied at creation.
  Throws util::ConfigurationError when the bytes are not JPEG/PNG/WebP.
*/
FrameTemplate DecodeTemplate(std::string_view bytes);

/*
  Decode and check a template. Throws util::ConfigurationError when the
  bytes are not JPEG/PNG/WebP, exceed max_template_bytes, or a dimension
  is outside 1..max_template_dimension.
*/
FrameTemplate LoadTemplate(std::string_view bytes, const CompositorOptions& options);

// Throws util::BoundsError unless rect has a non-zero area and lies inside width x height.
void ValidateRect(const OverlayRect& rect, uint32_t width, uint32_t height);

// Scale to cover width x height, then center-crop to exactly that size.
cv::Mat CoverFit(const cv::Mat& source, int width, int height);

class Compositor {
 public:
  virtual ~Compositor() = default;

  /*
    Decode product_bytes, cover-fit it into rect and paste it onto a copy
    of the template. Throws util::CompositeError; rect is assumed to have
    passed ValidateRect.
  */
  virtual cv::Mat Composite(const FrameTemplate& frame, const OverlayRect& rect, std::string_view product_bytes) const = 0;

  virtual int OutputQuality() const = 0;

  // Composite, then re-encode in the template's format at OutputQuality().
  std::string Compose(const FrameTemplate& frame, const OverlayRect& rect, std::string_view product_bytes) const;
};

class OpenCvCompositor final : public Compositor {
 public:
  explicit OpenCvCompositor(CompositorOptions options);

  cv::Mat Composite(const FrameTemplate& frame, const OverlayRect& rect, std::string_view product_bytes) const override;

  int OutputQuality() const override {
    return options_.output_quality;
  }

  const CompositorOptions& Options() const {
    return options_;
  }

 private:
  CompositorOptions options_;
};

} // namespace framecomp::image
