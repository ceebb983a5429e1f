#include "internal/image/image_codec.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <vector>

#include "internal/util/errors.hpp"

namespace framecomp::image {

using util::CompositeError;

namespace {

bool StartsWith(std::string_view bytes, std::string_view magic, size_t offset = 0) {
  return bytes.size() >= offset + magic.size() && bytes.compare(offset, magic.size(), magic) == 0;
}

uint32_t U8(std::string_view bytes, size_t at) {
  return static_cast<uint8_t>(bytes[at]);
}

uint32_t BigEndian16(std::string_view bytes, size_t at) {
  return (U8(bytes, at) << 8) | U8(bytes, at + 1);
}

uint32_t BigEndian32(std::string_view bytes, size_t at) {
  return (BigEndian16(bytes, at) << 16) | BigEndian16(bytes, at + 2);
}

uint32_t LittleEndian16(std::string_view bytes, size_t at) {
  return U8(bytes, at) | (U8(bytes, at + 1) << 8);
}

uint32_t LittleEndian24(std::string_view bytes, size_t at) {
  return LittleEndian16(bytes, at) | (U8(bytes, at + 2) << 16);
}

std::optional<Dimensions> PngDimensions(std::string_view bytes) {
  // signature, IHDR length, "IHDR", width, height
  if (bytes.size() < 24 || !StartsWith(bytes, "IHDR", 12)) {
    return std::nullopt;
  }
  return Dimensions{BigEndian32(bytes, 16), BigEndian32(bytes, 20)};
}

std::optional<Dimensions> JpegDimensions(std::string_view bytes) {
  size_t pos = 2;
  while (pos + 1 < bytes.size()) {
    if (U8(bytes, pos) != 0xFF) {
      return std::nullopt;
    }
    const uint32_t marker = U8(bytes, pos + 1);
    if (marker == 0xFF) {
      ++pos;
      continue;
    }
    pos += 2;

    // standalone markers carry no length
    if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8)) {
      continue;
    }
    if (marker == 0xD9 || marker == 0xDA) {
      return std::nullopt;
    }
    if (pos + 2 > bytes.size()) {
      return std::nullopt;
    }
    const uint32_t length = BigEndian16(bytes, pos);
    if (length < 2) {
      return std::nullopt;
    }

    // SOF0..SOF15 minus DHT, JPG and DAC: length, precision, height, width
    if (marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC) {
      if (pos + 7 > bytes.size()) {
        return std::nullopt;
      }
      return Dimensions{BigEndian16(bytes, pos + 5), BigEndian16(bytes, pos + 3)};
    }
    pos += length;
  }
  return std::nullopt;
}

std::optional<Dimensions> WebpDimensions(std::string_view bytes) {
  // RIFF header, then the first chunk's fourcc at 12 and payload at 20
  if (StartsWith(bytes, "VP8 ", 12)) {
    if (bytes.size() < 30 || !StartsWith(bytes, std::string_view("\x9D\x01\x2A", 3), 23)) {
      return std::nullopt;
    }
    return Dimensions{LittleEndian16(bytes, 26) & 0x3FFF, LittleEndian16(bytes, 28) & 0x3FFF};
  }
  if (StartsWith(bytes, "VP8L", 12)) {
    if (bytes.size() < 25 || U8(bytes, 20) != 0x2F) {
      return std::nullopt;
    }
    const uint32_t b0 = U8(bytes, 21), b1 = U8(bytes, 22), b2 = U8(bytes, 23), b3 = U8(bytes, 24);
    return Dimensions{1 + (b0 | ((b1 & 0x3F) << 8)), 1 + ((b1 >> 6) | (b2 << 2) | ((b3 & 0x0F) << 10))};
  }
  if (StartsWith(bytes, "VP8X", 12)) {
    if (bytes.size() < 30) {
      return std::nullopt;
    }
    return Dimensions{1 + LittleEndian24(bytes, 24), 1 + LittleEndian24(bytes, 27)};
  }
  return std::nullopt;
}

const char* EncoderExtension(v1::ImageFormat format) {
  switch (format) {
    case v1::IMAGE_FORMAT_JPEG:
      return ".jpg";
    case v1::IMAGE_FORMAT_PNG:
      return ".png";
    case v1::IMAGE_FORMAT_WEBP:
      return ".webp";
    default:
      return nullptr;
  }
}

} // namespace

v1::ImageFormat DetectFormat(std::string_view bytes) {
  if (StartsWith(bytes, std::string_view("\xFF\xD8\xFF", 3))) {
    return v1::IMAGE_FORMAT_JPEG;
  }
  if (StartsWith(bytes, std::string_view("\x89PNG\r\n\x1A\n", 8))) {
    return v1::IMAGE_FORMAT_PNG;
  }
  if (StartsWith(bytes, "RIFF") && StartsWith(bytes, "WEBP", 8)) {
    return v1::IMAGE_FORMAT_WEBP;
  }
  return v1::IMAGE_FORMAT_UNSPECIFIED;
}

std::string MimeType(v1::ImageFormat format) {
  switch (format) {
    case v1::IMAGE_FORMAT_JPEG:
      return "image/jpeg";
    case v1::IMAGE_FORMAT_PNG:
      return "image/png";
    case v1::IMAGE_FORMAT_WEBP:
      return "image/webp";
    default:
      return "application/octet-stream";
  }
}

std::optional<Dimensions> PeekDimensions(std::string_view bytes) {
  switch (DetectFormat(bytes)) {
    case v1::IMAGE_FORMAT_PNG:
      return PngDimensions(bytes);
    case v1::IMAGE_FORMAT_JPEG:
      return JpegDimensions(bytes);
    case v1::IMAGE_FORMAT_WEBP:
      return WebpDimensions(bytes);
    default:
      return std::nullopt;
  }
}

cv::Mat Decode(std::string_view bytes) {
  if (bytes.empty()) {
    throw CompositeError(CompositeError::Kind::kDecodeFailed, "empty image");
  }

  // imdecode never writes through the buffer
  cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<char*>(bytes.data()));

  cv::Mat pixels;
  try {
    pixels = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    throw CompositeError(CompositeError::Kind::kDecodeFailed, std::string("image decode failed: ") + e.what());
  }
  if (pixels.empty()) {
    throw CompositeError(CompositeError::Kind::kDecodeFailed, "image decode failed: unsupported or corrupt data");
  }
  return pixels;
}

std::string Encode(const cv::Mat& pixels, v1::ImageFormat format, int quality) {
  const char* ext = EncoderExtension(format);
  if (!ext) {
    throw CompositeError(CompositeError::Kind::kEncodeFailed, "no encoder for image format " + v1::ImageFormat_Name(format));
  }

  quality = std::clamp(quality, 1, 100);

  std::vector<int> params;
  switch (format) {
    case v1::IMAGE_FORMAT_JPEG:
      params = {cv::IMWRITE_JPEG_QUALITY, quality};
      break;
    case v1::IMAGE_FORMAT_WEBP:
      params = {cv::IMWRITE_WEBP_QUALITY, quality};
      break;
    case v1::IMAGE_FORMAT_PNG:
      params = {cv::IMWRITE_PNG_COMPRESSION, 3};
      break;
    default:
      break;
  }

  std::vector<uchar> encoded;
  try {
    if (!cv::imencode(ext, pixels, encoded, params)) {
      throw CompositeError(CompositeError::Kind::kEncodeFailed, std::string("imencode returned false for ") + ext);
    }
  } catch (const cv::Exception& e) {
    throw CompositeError(CompositeError::Kind::kEncodeFailed, std::string("image encode failed: ") + e.what());
  }
  return std::string(encoded.begin(), encoded.end());
}

} // namespace framecomp::image
