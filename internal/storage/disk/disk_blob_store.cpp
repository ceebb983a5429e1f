#include "disk_blob_store.hpp"

#include <arrow/io/file.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <sstream>
#include <thread>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/key_utils.hpp"
#include "internal/util/errors.hpp"

namespace framecomp::storage {

using namespace framecomp::storage::common;

namespace {

std::atomic<uint64_t> tmp_counter{0};

std::string TmpSuffix() {
  std::ostringstream out;
  out << ".tmp." << std::this_thread::get_id() << "." << tmp_counter.fetch_add(1);
  return out.str();
}

} // namespace

DiskBlobStore::DiskBlobStore(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  std::filesystem::create_directories(root_);
}

std::filesystem::path DiskBlobStore::PathFor(const std::string& key) const {
  ValidateKey(key);
  return root_ / key;
}

/*
  Read entire blob from disk.
*/
std::shared_ptr<arrow::Buffer> DiskBlobStore::Read(const std::string& key) {
  auto path = PathFor(key);
  if (!std::filesystem::is_regular_file(path)) {
    throw util::NotFound("blob not found: " + key);
  }

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void DiskBlobStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  auto final_path = PathFor(key);
  std::filesystem::create_directories(final_path.parent_path());
  auto tmp_path = final_path.string() + TmpSuffix();

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));

    if (fsync_)
      Unwrap(out->Flush());

    Unwrap(out->Close());
  }

  std::filesystem::rename(tmp_path, final_path);
}

bool DiskBlobStore::Exists(const std::string& key) {
  return std::filesystem::is_regular_file(PathFor(key));
}

void DiskBlobStore::Remove(const std::string& key) {
  std::filesystem::remove(PathFor(key));
}

void DiskBlobStore::RemovePrefix(const std::string& prefix) {
  ValidatePrefix(prefix);
  std::filesystem::remove_all(root_ / prefix.substr(0, prefix.size() - 1));
}

/*
  Walks <root>/<prefix>. In-flight .tmp files are not blobs yet.
*/
std::vector<std::string> DiskBlobStore::List(const std::string& prefix) {
  ValidatePrefix(prefix);
  std::vector<std::string> keys;
  auto dir = root_ / prefix.substr(0, prefix.size() - 1);
  if (!std::filesystem::is_directory(dir)) {
    return keys;
  }

  for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    auto key = entry.path().lexically_relative(root_).generic_string();
    if (key.find(".tmp.") != std::string::npos) continue;
    keys.push_back(std::move(key));
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

void DiskBlobStore::Probe() {
  if (!std::filesystem::is_directory(root_)) {
    throw std::runtime_error("storage root missing: " + root_.string());
  }
}

} // namespace framecomp::storage
