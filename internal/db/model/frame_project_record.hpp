#pragma once

#include <cstdint>
#include <string>

#include "framecomp/v1/types.pb.h"

namespace framecomp::db::model {

/*
  Persistent frame project row.

  - template_* describe the validated template image; the bytes live in
    the blob store under template_key.
  - rect_* are meaningful only when rect_set is true.
  - total/succeeded/failed are the counters of the latest bulk run.
*/

struct FrameProjectRecord {
  std::string id;
  std::string name;
  std::string owner;

  std::string                  template_key;
  uint32_t                     template_width  = 0;
  uint32_t                     template_height = 0;
  framecomp::v1::ImageFormat   template_format = framecomp::v1::IMAGE_FORMAT_UNSPECIFIED;

  uint32_t rect_x      = 0;
  uint32_t rect_y      = 0;
  uint32_t rect_width  = 0;
  uint32_t rect_height = 0;
  bool     rect_set    = false;

  std::string feed_url;

  framecomp::v1::ProjectStatus status = framecomp::v1::PROJECT_STATUS_DRAFT;

  uint64_t total_items     = 0;
  uint64_t succeeded_items = 0;
  uint64_t failed_items    = 0;
  std::string last_error;

  uint64_t created_at_ms       = 0;
  uint64_t updated_at_ms       = 0;
  uint64_t run_started_at_ms   = 0;
  uint64_t run_completed_at_ms = 0;
};

} // namespace framecomp::db::model
