#include "ram_blob_store.hpp"

#include <algorithm>
#include <mutex>

#include "internal/storage/common/key_utils.hpp"
#include "internal/util/errors.hpp"

namespace framecomp::storage {

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamBlobStore::Read(const std::string& key) {
  common::ValidateKey(key);
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) throw util::NotFound("blob not found: " + key);

  return it->second;
}

void RamBlobStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  common::ValidateKey(key);
  std::unique_lock lock(mutex_);
  buffers_[key] = buffer;
}

bool RamBlobStore::Exists(const std::string& key) {
  common::ValidateKey(key);
  std::shared_lock lock(mutex_);
  return buffers_.count(key) != 0;
}

void RamBlobStore::Remove(const std::string& key) {
  common::ValidateKey(key);
  std::unique_lock lock(mutex_);
  buffers_.erase(key);
}

void RamBlobStore::RemovePrefix(const std::string& prefix) {
  common::ValidatePrefix(prefix);
  std::unique_lock lock(mutex_);
  for (auto it = buffers_.begin(); it != buffers_.end();) {
    if (it->first.compare(0, prefix.size(), prefix) == 0) {
      it = buffers_.erase(it);
    } else {
      ++it;
    }
  }
}

std::vector<std::string> RamBlobStore::List(const std::string& prefix) {
  common::ValidatePrefix(prefix);
  std::vector<std::string> keys;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [key, buffer] : buffers_) {
      if (key.compare(0, prefix.size(), prefix) == 0) {
        keys.push_back(key);
      }
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::size_t RamBlobStore::Count() const {
  std::shared_lock lock(mutex_);
  return buffers_.size();
}

} // namespace framecomp::storage
