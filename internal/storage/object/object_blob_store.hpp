#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/blob_store.hpp"

namespace framecomp::storage {

/*
  Object-store backed blobs through Arrow's filesystem layer.

  Object key layout:

      <root_path>/<key>
*/

class ObjectBlobStore final : public BlobStore {
public:
  ObjectBlobStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;
  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;
  bool Exists(const std::string& key) override;
  void Remove(const std::string& key) override;
  void RemovePrefix(const std::string& prefix) override;
  std::vector<std::string> List(const std::string& prefix) override;
  void Probe() override;

  std::string Name() const override {
    return "object";
  }

private:
  std::string ObjectPath(const std::string& key) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string root_path_;
};

} // namespace framecomp::storage
