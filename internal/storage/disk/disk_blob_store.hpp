#pragma once

#include <filesystem>
#include <memory>

#include "internal/storage/blob_store.hpp"

namespace framecomp::storage {

/*
  Disk blob store.

  Blobs live under <root>/<key>. Writes go to a sibling .tmp file
  and are renamed into place, so readers never observe a partial image.
*/

class DiskBlobStore final : public BlobStore {
public:
  DiskBlobStore(std::filesystem::path root, bool fsync);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;
  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;
  bool Exists(const std::string& key) override;
  void Remove(const std::string& key) override;
  void RemovePrefix(const std::string& prefix) override;
  std::vector<std::string> List(const std::string& prefix) override;
  void Probe() override;

  std::string Name() const override {
    return "disk";
  }

private:
  std::filesystem::path PathFor(const std::string& key) const;

  std::filesystem::path root_;
  bool fsync_;
};

} // namespace framecomp::storage
