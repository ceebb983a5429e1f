#include "object_blob_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <algorithm>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/key_utils.hpp"
#include "internal/util/errors.hpp"

namespace framecomp::storage {

using namespace framecomp::storage::common;

ObjectBlobStore::ObjectBlobStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
}

std::string ObjectBlobStore::ObjectPath(const std::string& key) const {
  ValidateKey(key);
  if (root_path_.empty()) {
    return key;
  }
  if (root_path_.back() == '/') {
    return root_path_ + key;
  }
  return root_path_ + "/" + key;
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ObjectBlobStore::Read(const std::string& key) {
  auto path = ObjectPath(key);
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("blob not found: " + key);
  }

  auto input = Unwrap(fs_->OpenInputFile(path));
  return ReadAll(input);
}

/*
  Upload buffer as object. Object stores are atomic per PUT.
*/
void ObjectBlobStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  auto path = ObjectPath(key);
  auto slash = path.rfind('/');
  if (slash != std::string::npos && slash > 0) {
    Unwrap(fs_->CreateDir(path.substr(0, slash), /*recursive=*/true));
  }

  auto out = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(buffer->data(), buffer->size()));
  Unwrap(out->Close());
}

bool ObjectBlobStore::Exists(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.type() == arrow::fs::FileType::File;
}

void ObjectBlobStore::Remove(const std::string& key) {
  auto path = ObjectPath(key);
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() == arrow::fs::FileType::NotFound) {
    return;
  }
  Unwrap(fs_->DeleteFile(path));
}

void ObjectBlobStore::RemovePrefix(const std::string& prefix) {
  ValidatePrefix(prefix);
  auto dir  = ObjectPath(prefix.substr(0, prefix.size() - 1));
  auto info = Unwrap(fs_->GetFileInfo(dir));
  if (info.type() != arrow::fs::FileType::Directory) {
    return;
  }
  Unwrap(fs_->DeleteDir(dir));
}

std::vector<std::string> ObjectBlobStore::List(const std::string& prefix) {
  ValidatePrefix(prefix);
  std::vector<std::string> keys;

  arrow::fs::FileSelector selector;
  selector.base_dir        = ObjectPath(prefix.substr(0, prefix.size() - 1));
  selector.allow_not_found = true;
  selector.recursive       = true;

  // keys are object paths minus the root
  std::string base = root_path_;
  if (!base.empty() && base.back() != '/') {
    base += '/';
  }
  for (const auto& info : Unwrap(fs_->GetFileInfo(selector))) {
    if (info.type() != arrow::fs::FileType::File) continue;
    const auto& path = info.path();
    if (path.compare(0, base.size(), base) != 0) continue;
    keys.push_back(path.substr(base.size()));
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

void ObjectBlobStore::Probe() {
  auto info = Unwrap(fs_->GetFileInfo(root_path_.empty() ? std::string{"/"} : root_path_));
  if (info.type() == arrow::fs::FileType::Unknown) {
    throw std::runtime_error("object storage root is not reachable: " + root_path_);
  }
}

} // namespace framecomp::storage
