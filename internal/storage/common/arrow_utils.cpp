#include "arrow_utils.hpp"

namespace framecomp::storage::common {

std::shared_ptr<arrow::Buffer> ToBuffer(std::string bytes) {
  return arrow::Buffer::FromString(std::move(bytes));
}

std::string ToString(const std::shared_ptr<arrow::Buffer>& buffer) {
  if (!buffer) {
    return {};
  }
  return buffer->ToString();
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri) {
  if (uri.empty()) {
    return arrow::Status::Invalid("object storage uri must not be empty");
  }

  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri, &resolved_path));
  while (resolved_path.size() > 1 && resolved_path.back() == '/') {
    resolved_path.pop_back();
  }
  return std::make_pair(std::move(fs), std::move(resolved_path));
}

} // namespace framecomp::storage::common
