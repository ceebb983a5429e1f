#pragma once

#include "blob_store.hpp"
#include "config/config.pb.h"

namespace framecomp::storage {

/*
  Builds the configured blob store.

  Disk under /tmp/frame-compositor is used when no backend is configured.
*/

class StorageFactory {
 public:
  static BlobStorePtr Build(const framecomp::runtime::config::StorageConfig& cfg);
};

} // namespace framecomp::storage
