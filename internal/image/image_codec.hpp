#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "framecomp/v1/types.pb.h"

namespace framecomp::image {

// Sniffs JPEG / PNG / WebP signatures. UNSPECIFIED for anything else.
framecomp::v1::ImageFormat DetectFormat(std::string_view bytes);

std::string MimeType(framecomp::v1::ImageFormat format);

struct Dimensions {
  uint32_t width  = 0;
  uint32_t height = 0;
};

/*
  Width and height as declared by the header, without decoding pixels:
    PNG   IHDR
    JPEG  first SOFn segment before the scan
    WebP  VP8 / VP8L / VP8X chunk
  nullopt for other formats and for truncated or malformed headers.
*/
std::optional<Dimensions> PeekDimensions(std::string_view bytes);

// 8-bit BGR. Throws util::CompositeError(kDecodeFailed).
cv::Mat Decode(std::string_view bytes);

/*
  quality applies to JPEG and WebP (1..100). PNG is written losslessly
  at the default compression level.
  Throws util::CompositeError(kEncodeFailed).
*/
std::string Encode(const cv::Mat& pixels, framecomp::v1::ImageFormat format, int quality);

} // namespace framecomp::image
