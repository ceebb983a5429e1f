#pragma once

#include <string>
#include <string_view>

#include "framecomp/v1/types.pb.h"

namespace framecomp::storage::common {

/*
  Blob key validation and layout.

  Keys never contain empty segments, "." / "..", backslashes or NUL,
  so they map safely onto filesystem paths.
*/

void ValidateKey(std::string_view key);

// Like ValidateKey, but the prefix must end in '/'.
void ValidatePrefix(std::string_view prefix);

/*
  Filesystem-safe product id: [A-Za-z0-9_-] capped at 50 chars, then a
  stable 64-bit FNV-1a hash of the full id so distinct ids never collide.
*/
std::string SafeProductId(std::string_view product_id);

std::string ExtensionFor(framecomp::v1::ImageFormat format);

std::string TemplateKey(const std::string& project_id, framecomp::v1::ImageFormat format);
std::string OutputKey(const std::string& project_id, std::string_view product_id, framecomp::v1::ImageFormat format);
std::string OutputPrefix(const std::string& project_id);

} // namespace framecomp::storage::common
