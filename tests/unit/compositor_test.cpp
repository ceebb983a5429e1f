#include <opencv2/core.hpp>

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include "internal/image/compositor.hpp"
#include "internal/image/image_codec.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using framecomp::image::CompositorOptions;
using framecomp::image::CoverFit;
using framecomp::image::Decode;
using framecomp::image::DetectFormat;
using framecomp::image::LoadTemplate;
using framecomp::image::OpenCvCompositor;
using framecomp::image::OverlayRect;
using framecomp::image::PeekDimensions;
using framecomp::image::ValidateRect;
using framecomp::testing::SolidImage;
using framecomp::util::CompositeError;

const cv::Scalar kBlue(255, 0, 0);
const cv::Scalar kRed(0, 0, 255);

bool PixelIs(const cv::Mat& image, int x, int y, cv::Vec3b bgr) {
  return image.at<cv::Vec3b>(y, x) == bgr;
}

void TestPasteLandsInsideRect() {
  auto              frame = LoadTemplate(SolidImage(800, 600, kBlue), CompositorOptions{});
  OpenCvCompositor  compositor(CompositorOptions{});
  const OverlayRect rect{50, 50, 200, 150};

  auto out = compositor.Composite(frame, rect, SolidImage(400, 300, kRed));
  assert(out.cols == 800 && out.rows == 600);

  const cv::Vec3b blue(255, 0, 0);
  const cv::Vec3b red(0, 0, 255);
  assert(PixelIs(out, 50, 50, red));
  assert(PixelIs(out, 249, 199, red));
  assert(PixelIs(out, 150, 120, red));
  assert(PixelIs(out, 49, 50, blue));
  assert(PixelIs(out, 250, 100, blue));
  assert(PixelIs(out, 100, 200, blue));
  assert(PixelIs(out, 0, 0, blue));

  // the template itself is untouched
  assert(PixelIs(frame.pixels, 100, 100, blue));
}

void TestCoverFitCropsCenter() {
  // 100x400: green on top, white band in the middle, red at the bottom
  cv::Mat tall(400, 100, CV_8UC3, cv::Scalar(0, 255, 0));
  tall(cv::Rect(0, 150, 100, 100)).setTo(cv::Scalar(255, 255, 255));
  tall(cv::Rect(0, 250, 100, 150)).setTo(cv::Scalar(0, 0, 255));

  auto fitted = CoverFit(tall, 200, 150);
  assert(fitted.cols == 200 && fitted.rows == 150);
  // scaled x2 to 200x800, rows 325..475 kept: all inside the white band
  const cv::Vec3b white(255, 255, 255);
  assert(PixelIs(fitted, 0, 0, white));
  assert(PixelIs(fitted, 199, 149, white));
  assert(PixelIs(fitted, 100, 75, white));

  cv::Mat wide(100, 1000, CV_8UC3, cv::Scalar(1, 2, 3));
  auto    squeezed = CoverFit(wide, 37, 11);
  assert(squeezed.cols == 37 && squeezed.rows == 11);

  cv::Mat same(150, 200, CV_8UC3, cv::Scalar(9, 9, 9));
  auto    unchanged = CoverFit(same, 200, 150);
  assert(unchanged.cols == 200 && unchanged.rows == 150);
}

void TestOutputKeepsTemplateFormat() {
  OpenCvCompositor compositor(CompositorOptions{});

  auto jpeg_frame = LoadTemplate(SolidImage(320, 240, kBlue, framecomp::v1::IMAGE_FORMAT_JPEG), CompositorOptions{});
  assert(jpeg_frame.format == framecomp::v1::IMAGE_FORMAT_JPEG);
  auto jpeg = compositor.Compose(jpeg_frame, OverlayRect{10, 10, 100, 100}, SolidImage(50, 50, kRed));
  assert(DetectFormat(jpeg) == framecomp::v1::IMAGE_FORMAT_JPEG);

  auto png_frame = LoadTemplate(SolidImage(320, 240, kBlue), CompositorOptions{});
  auto png       = compositor.Compose(png_frame, OverlayRect{10, 10, 100, 100}, SolidImage(50, 50, kRed, framecomp::v1::IMAGE_FORMAT_JPEG));
  assert(DetectFormat(png) == framecomp::v1::IMAGE_FORMAT_PNG);

  auto decoded = Decode(png);
  assert(decoded.cols == 320 && decoded.rows == 240);
}

void TestSourceDimensionLimits() {
  CompositorOptions options;
  options.min_source_dimension = 10;
  options.max_source_dimension = 500;
  OpenCvCompositor compositor(options);
  auto             frame = LoadTemplate(SolidImage(100, 100, kBlue), options);

  const std::string inputs[] = {SolidImage(5, 50, kRed), SolidImage(600, 50, kRed)};
  for (const auto& input : inputs) {
    bool rejected = false;
    try {
      compositor.Composite(frame, OverlayRect{0, 0, 10, 10}, input);
    } catch (const CompositeError& e) {
      rejected = e.kind() == CompositeError::Kind::kUnsupportedDimensions;
    }
    assert(rejected);
  }

  bool undecodable = false;
  try {
    compositor.Composite(frame, OverlayRect{0, 0, 10, 10}, "definitely not an image");
  } catch (const CompositeError& e) {
    undecodable = e.kind() == CompositeError::Kind::kDecodeFailed;
  }
  assert(undecodable);
}

void PutBigEndian(std::string& bytes, size_t at, uint32_t value, int width) {
  for (int i = 0; i < width; ++i) {
    bytes[at + i] = static_cast<char>((value >> (8 * (width - 1 - i))) & 0xFF);
  }
}

// RIFF container holding one extended-format chunk of the given canvas size.
std::string WebpExtendedHeader(uint32_t width, uint32_t height) {
  std::string bytes = std::string("RIFF") + std::string(4, '\0') + "WEBPVP8X" + std::string(4, '\0') + std::string(4, '\0');
  for (uint32_t value : {width - 1, height - 1}) {
    for (int i = 0; i < 3; ++i) bytes.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
  }
  return bytes;
}

void TestHeaderDimensions() {
  for (auto format : {framecomp::v1::IMAGE_FORMAT_PNG, framecomp::v1::IMAGE_FORMAT_JPEG, framecomp::v1::IMAGE_FORMAT_WEBP}) {
    auto declared = PeekDimensions(SolidImage(321, 123, kRed, format));
    assert(declared.has_value());
    assert(declared->width == 321 && declared->height == 123);
  }

  auto extended = PeekDimensions(WebpExtendedHeader(16000, 9000));
  assert(extended && extended->width == 16000 && extended->height == 9000);

  // lossless bitstream: 14-bit width-1 and height-1 packed after the 0x2f signature
  std::string lossless = std::string("RIFF") + std::string(4, '\0') + "WEBPVP8L" + std::string(4, '\0') + "\x2F\x7F\xFE\xC9\x08";
  auto        packed   = PeekDimensions(lossless);
  assert(packed && packed->width == 16000 && packed->height == 9000);

  assert(!PeekDimensions("").has_value());
  assert(!PeekDimensions(std::string("\x89PNG\r\n\x1A\n", 8)).has_value());
  assert(!PeekDimensions(std::string("\xFF\xD8\xFF\xDA\x00\x08", 6)).has_value());
  assert(!PeekDimensions("GIF89a....").has_value());
}

void TestOversizedHeadersRejectedBeforeDecode() {
  CompositorOptions options;
  options.max_source_dimension   = 500;
  options.max_template_dimension = 1000;
  OpenCvCompositor compositor(options);
  auto             frame = LoadTemplate(SolidImage(100, 100, kBlue), options);

  // a small PNG whose IHDR claims 30000x30000
  std::string png = SolidImage(40, 40, kRed);
  PutBigEndian(png, 16, 30000, 4);
  PutBigEndian(png, 20, 30000, 4);

  std::string jpeg = SolidImage(40, 30, kRed, framecomp::v1::IMAGE_FORMAT_JPEG);
  const auto  sof  = jpeg.find(std::string("\xFF\xC0", 2));
  assert(sof != std::string::npos);
  PutBigEndian(jpeg, sof + 5, 20000, 2);
  PutBigEndian(jpeg, sof + 7, 20000, 2);
  assert(PeekDimensions(jpeg)->height == 20000);

  const std::string inputs[] = {png, jpeg, WebpExtendedHeader(16000, 16000)};
  for (const auto& input : inputs) {
    std::string message;
    bool        rejected = false;
    try {
      compositor.Composite(frame, OverlayRect{0, 0, 10, 10}, input);
    } catch (const CompositeError& e) {
      rejected = e.kind() == CompositeError::Kind::kUnsupportedDimensions;
      message  = e.what();
    }
    assert(rejected);
    assert(message.find("outside 10..500") != std::string::npos);
  }

  std::string message;
  try {
    LoadTemplate(png, options);
  } catch (const framecomp::util::ConfigurationError& e) {
    message = e.what();
  }
  assert(message.find("template dimensions 30000x30000") != std::string::npos);
}

void TestValidateRect() {
  ValidateRect(OverlayRect{0, 0, 800, 600}, 800, 600);
  ValidateRect(OverlayRect{799, 599, 1, 1}, 800, 600);

  const OverlayRect bad[] = {
      {0, 0, 0, 10},
      {0, 0, 10, 0},
      {700, 0, 101, 10},
      {0, 500, 10, 101},
      {std::numeric_limits<uint32_t>::max(), 0, 2, 2},
      {0, 1, 10, std::numeric_limits<uint32_t>::max()},
  };
  for (const auto& rect : bad) {
    bool threw = false;
    try {
      ValidateRect(rect, 800, 600);
    } catch (const framecomp::util::BoundsError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestTemplateValidation() {
  CompositorOptions options;
  options.max_template_dimension = 1000;

  auto frame = LoadTemplate(SolidImage(1000, 10, kBlue), options);
  assert(frame.Width() == 1000 && frame.Height() == 10);

  const std::string inputs[] = {"", "GIF89a....", SolidImage(1001, 10, kBlue)};
  for (const auto& input : inputs) {
    bool threw = false;
    try {
      LoadTemplate(input, options);
    } catch (const framecomp::util::ConfigurationError&) {
      threw = true;
    }
    assert(threw);
  }

  options.max_template_bytes = 16;
  bool too_big = false;
  try {
    LoadTemplate(SolidImage(20, 20, kBlue), options);
  } catch (const framecomp::util::ConfigurationError&) {
    too_big = true;
  }
  assert(too_big);
}

} // namespace

int main() {
  TestPasteLandsInsideRect();
  TestCoverFitCropsCenter();
  TestOutputKeepsTemplateFormat();
  TestSourceDimensionLimits();
  TestHeaderDimensions();
  TestOversizedHeadersRejectedBeforeDecode();
  TestValidateRect();
  TestTemplateValidation();

  std::cout << "framecomp_unit_compositor: pass\n";
  return 0;
}
