#include "key_utils.hpp"

#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace framecomp::storage::common {

namespace {

void ValidateSegments(std::string_view path) {
  std::size_t start = 0;
  while (start <= path.size()) {
    const auto end     = path.find('/', start);
    const auto segment = path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (segment.empty()) {
      throw std::invalid_argument("blob key contains an empty segment");
    }
    if (segment == "." || segment == "..") {
      throw std::invalid_argument("blob key must not contain relative path components");
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
}

uint64_t Fnv1a64(std::string_view data) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

} // namespace

void ValidateKey(std::string_view key) {
  if (key.empty()) {
    throw std::invalid_argument("blob key must not be empty");
  }
  for (char c : key) {
    if (c == '\\' || c == '\0') {
      throw std::invalid_argument("blob key contains invalid character");
    }
  }
  ValidateSegments(key);
}

void ValidatePrefix(std::string_view prefix) {
  if (prefix.size() < 2 || prefix.back() != '/') {
    throw std::invalid_argument("blob prefix must end with '/'");
  }
  ValidateKey(prefix.substr(0, prefix.size() - 1));
}

std::string SafeProductId(std::string_view product_id) {
  std::string safe;
  for (char c : product_id) {
    if (safe.size() >= 50) break;
    const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    if (alnum || c == '-' || c == '_') {
      safe.push_back(c);
    }
  }
  if (safe.empty()) {
    safe = "product";
  }

  char hash[17];
  std::snprintf(hash, sizeof(hash), "%016llx", static_cast<unsigned long long>(Fnv1a64(product_id)));
  return safe + "-" + hash;
}

std::string ExtensionFor(framecomp::v1::ImageFormat format) {
  switch (format) {
    case framecomp::v1::IMAGE_FORMAT_PNG:
      return "png";
    case framecomp::v1::IMAGE_FORMAT_WEBP:
      return "webp";
    case framecomp::v1::IMAGE_FORMAT_JPEG:
    default:
      return "jpg";
  }
}

std::string TemplateKey(const std::string& project_id, framecomp::v1::ImageFormat format) {
  auto key = "templates/" + project_id + "." + ExtensionFor(format);
  ValidateKey(key);
  return key;
}

std::string OutputKey(const std::string& project_id, std::string_view product_id, framecomp::v1::ImageFormat format) {
  auto key = OutputPrefix(project_id) + SafeProductId(product_id) + "." + ExtensionFor(format);
  ValidateKey(key);
  return key;
}

std::string OutputPrefix(const std::string& project_id) {
  auto prefix = "outputs/" + project_id + "/";
  ValidatePrefix(prefix);
  return prefix;
}

} // namespace framecomp::storage::common
