#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>
#include <vector>

namespace framecomp::storage {

/*
  Binary blob storage for template and output images.

  Every image is carried as an Arrow Buffer; callers never see raw
  file handles.

  Keys are relative, '/'-separated paths:
    templates/<project_id>.<ext>
    outputs/<project_id>/<safe_product_id>.<ext>

  Implementations:
    RAM      → in-memory Arrow buffers
    DISK     → Arrow file IO under a root directory
    OBJECT   → any Arrow filesystem URI (S3 / MinIO / local)
*/

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  /*
    Read the whole blob.

    Throws util::NotFound when the key does not exist.
  */
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& key) = 0;

  /*
    Create or replace the blob atomically with respect to readers.
  */
  virtual void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  virtual bool Exists(const std::string& key) = 0;

  // Missing keys are not an error.
  virtual void Remove(const std::string& key) = 0;

  // Removes every blob whose key starts with prefix (a directory-like key ending in '/').
  virtual void RemovePrefix(const std::string& prefix) = 0;

  // Every key under prefix (same form as RemovePrefix), sorted.
  virtual std::vector<std::string> List(const std::string& prefix) = 0;

  /*
    Cheap connectivity check used by the storage health probe.
    Throws on failure.
  */
  virtual void Probe() = 0;

  virtual std::string Name() const = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace framecomp::storage
