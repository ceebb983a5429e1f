#pragma once

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include <arrow/buffer.h>

#include "internal/storage/blob_store.hpp"

namespace framecomp::storage {

/*
  RAM blob store.

  Backed by Arrow buffers stored in-memory. Used by tests and
  throwaway deployments; contents vanish with the process.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamBlobStore final : public BlobStore {
public:
  RamBlobStore() = default;
  ~RamBlobStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;
  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;
  bool Exists(const std::string& key) override;
  void Remove(const std::string& key) override;
  void RemovePrefix(const std::string& prefix) override;
  std::vector<std::string> List(const std::string& prefix) override;
  void Probe() override {}

  std::string Name() const override {
    return "ram";
  }

  std::size_t Count() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace framecomp::storage
