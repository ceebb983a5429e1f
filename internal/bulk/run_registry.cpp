#include "run_registry.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace framecomp::bulk {

bool RunRegistry::Active(const Entry& entry) {
  auto state = entry.status.state();
  return state == v1::RUN_STATE_QUEUED || state == v1::RUN_STATE_RUNNING;
}

v1::RunHandle RunRegistry::Reserve(const std::string& project_id) {
  std::lock_guard lock(mutex_);

  auto it = runs_.find(project_id);
  if (it != runs_.end() && Active(it->second)) {
    throw util::AlreadyRunningError("a bulk run is already active for project " + project_id + " (run " +
                                    it->second.status.handle().run_id() + ")");
  }

  Entry entry;
  entry.status.mutable_handle()->set_run_id(util::GenerateUUIDString());
  entry.status.mutable_handle()->set_project_id(project_id);
  entry.status.set_state(v1::RUN_STATE_QUEUED);
  *entry.status.mutable_started_at() = util::MillisToProto(util::NowMillis());
  entry.cancelled = std::make_shared<std::atomic<bool>>(false);

  auto handle      = entry.status.handle();
  runs_[project_id] = std::move(entry);
  return handle;
}

void RunRegistry::MarkRunning(const std::string& project_id) {
  std::lock_guard lock(mutex_);
  auto            it = runs_.find(project_id);
  if (it != runs_.end() && it->second.status.state() == v1::RUN_STATE_QUEUED) {
    it->second.status.set_state(v1::RUN_STATE_RUNNING);
  }
}

void RunRegistry::SetTotal(const std::string& project_id, uint64_t total_items) {
  std::lock_guard lock(mutex_);
  auto            it = runs_.find(project_id);
  if (it != runs_.end()) it->second.status.set_total_items(total_items);
}

void RunRegistry::SetProcessed(const std::string& project_id, uint64_t processed) {
  std::lock_guard lock(mutex_);
  auto            it = runs_.find(project_id);
  if (it != runs_.end()) it->second.status.set_processed(processed);
}

void RunRegistry::Finish(const std::string& project_id, v1::RunState state, const v1::BulkRunResult& result, const std::string& error) {
  std::lock_guard lock(mutex_);
  auto            it = runs_.find(project_id);
  if (it == runs_.end()) return;

  auto& status = it->second.status;
  status.set_state(state);
  *status.mutable_result() = result;
  status.set_error(error);
  *status.mutable_completed_at() = util::MillisToProto(util::NowMillis());
}

bool RunRegistry::Cancel(const std::string& project_id) {
  std::lock_guard lock(mutex_);
  auto            it = runs_.find(project_id);
  if (it == runs_.end() || !Active(it->second)) return false;
  it->second.cancelled->store(true);
  return true;
}

void RunRegistry::Forget(const std::string& project_id) {
  std::lock_guard lock(mutex_);
  runs_.erase(project_id);
}

CancelFlag RunRegistry::CancelFlagFor(const std::string& project_id) const {
  std::lock_guard lock(mutex_);
  auto            it = runs_.find(project_id);
  if (it == runs_.end()) return std::make_shared<std::atomic<bool>>(true);
  return it->second.cancelled;
}

std::optional<v1::RunStatus> RunRegistry::Get(const std::string& project_id) const {
  std::lock_guard lock(mutex_);
  auto            it = runs_.find(project_id);
  if (it == runs_.end()) return std::nullopt;
  return it->second.status;
}

bool RunRegistry::IsActive(const std::string& project_id) const {
  std::lock_guard lock(mutex_);
  auto            it = runs_.find(project_id);
  return it != runs_.end() && Active(it->second);
}

uint64_t RunRegistry::ActiveCount() const {
  std::lock_guard lock(mutex_);
  uint64_t        count = 0;
  for (const auto& [_, entry] : runs_) {
    if (Active(entry)) ++count;
  }
  return count;
}

} // namespace framecomp::bulk
