#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "framecomp/v1/types.pb.h"

namespace framecomp::db::model {

/*
  One composited result per (project_id, product_id).

  Re-running a project overwrites the row in place: created_at_ms is kept,
  everything else is replaced and generated_at_ms refreshed.
*/

struct OutputRecord {
  std::string project_id;
  std::string product_id;
  std::string product_image_url;

  framecomp::v1::OutputStatus status = framecomp::v1::OUTPUT_STATUS_UNSPECIFIED;
  std::string                 failure_reason;

  // empty when status is failed
  std::string image_key;

  uint64_t created_at_ms   = 0;
  uint64_t generated_at_ms = 0;
};

struct OutputQuery {
  std::string project_id;
  // case-insensitive substring of product_id; empty matches everything
  std::string search;
  uint64_t    offset = 0;
  uint32_t    limit  = 25;
};

struct OutputPage {
  uint64_t                  total    = 0;
  uint64_t                  filtered = 0;
  std::vector<OutputRecord> rows;
};

struct OutputCounts {
  uint64_t total     = 0;
  uint64_t succeeded = 0;
  uint64_t failed    = 0;
};

} // namespace framecomp::db::model
