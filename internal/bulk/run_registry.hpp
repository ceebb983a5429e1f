#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "framecomp/v1/types.pb.h"

namespace framecomp::bulk {

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

/*
  Per-project run bookkeeping.

  At most one run per project is active (QUEUED or RUNNING). The most
  recent finished run stays visible until the next one is reserved or
  the project is forgotten.
*/
class RunRegistry {
 public:
  // Throws util::AlreadyRunningError while a run is active for the project.
  framecomp::v1::RunHandle Reserve(const std::string& project_id);

  void MarkRunning(const std::string& project_id);
  void SetTotal(const std::string& project_id, uint64_t total_items);
  void SetProcessed(const std::string& project_id, uint64_t processed);

  // Terminal transition; the cancel flag is released.
  void Finish(const std::string& project_id, framecomp::v1::RunState state, const framecomp::v1::BulkRunResult& result,
              const std::string& error);

  // Flags the active run, if any. Returns true when one was flagged.
  bool Cancel(const std::string& project_id);

  // Drops all state for a deleted project.
  void Forget(const std::string& project_id);

  CancelFlag CancelFlagFor(const std::string& project_id) const;

  std::optional<framecomp::v1::RunStatus> Get(const std::string& project_id) const;

  bool IsActive(const std::string& project_id) const;
  uint64_t ActiveCount() const;

 private:
  struct Entry {
    framecomp::v1::RunStatus status;
    CancelFlag               cancelled;
  };

  static bool Active(const Entry& entry);

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> runs_;
};

} // namespace framecomp::bulk
