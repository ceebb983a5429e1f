#include "storage_factory.hpp"

#include <filesystem>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/disk_blob_store.hpp"
#include "internal/storage/object/object_blob_store.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"

namespace framecomp::storage {

BlobStorePtr StorageFactory::Build(const framecomp::runtime::config::StorageConfig& cfg) {
  switch (cfg.backend_case()) {
    case framecomp::runtime::config::StorageConfig::kRam:
      return std::make_shared<RamBlobStore>();

    case framecomp::runtime::config::StorageConfig::kObject: {
      auto [fs, root] = common::Unwrap(common::ResolveFileSystem(cfg.object().uri()));
      return std::make_shared<ObjectBlobStore>(std::move(fs), std::move(root));
    }

    case framecomp::runtime::config::StorageConfig::kDisk:
    case framecomp::runtime::config::StorageConfig::BACKEND_NOT_SET:
      break;
  }

  std::filesystem::path disk_root =
      cfg.disk().root_path().empty() ? std::filesystem::path{"/tmp/frame-compositor"} : std::filesystem::path{cfg.disk().root_path()};
  return std::make_shared<DiskBlobStore>(std::move(disk_root), cfg.disk().fsync());
}

} // namespace framecomp::storage
