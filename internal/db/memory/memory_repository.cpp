#include "memory_repository.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace framecomp::db::memory {

namespace {

// ASCII case folding, matching SQL LIKE.
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return true;
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
  return it != haystack.end();
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

Result MemoryRepository::Ping() {
  return Result::Ok();
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertProject(Transaction& t, const model::FrameProjectRecord& r) {
  if (TX(t).View().projects.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "project exists: " + r.id);
  auto& s = TX(t).Mutable([id = r.id](State& st) { st.projects.erase(id); });
  s.projects[r.id] = r;
  return Result::Ok();
}

std::optional<model::FrameProjectRecord> MemoryRepository::GetProject(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.projects.find(id);
  if (it == s.projects.end()) return std::nullopt;
  return it->second;
}

std::vector<model::FrameProjectRecord> MemoryRepository::ListProjects(Transaction& t, const std::string& owner) {
  const auto&                             s = TX(t).View();
  std::vector<model::FrameProjectRecord> records;
  for (const auto& [_, record] : s.projects) {
    if (owner.empty() || record.owner == owner) records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id < b.id;
  });
  return records;
}

Result MemoryRepository::UpdateProject(Transaction& t, const model::FrameProjectRecord& r) {
  auto it = TX(t).View().projects.find(r.id);
  if (it == TX(t).View().projects.end()) return Result::Err(ErrorCode::NotFound, "project not found: " + r.id);

  auto& s = TX(t).Mutable([previous = it->second](State& st) { st.projects[previous.id] = previous; });
  s.projects[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteProject(Transaction& t, const std::string& id) {
  const auto& view = TX(t).View();
  auto        pit  = view.projects.find(id);
  if (pit == view.projects.end()) return Result::Ok();

  std::map<std::string, model::OutputRecord> previous_outputs;
  if (auto oit = view.outputs.find(id); oit != view.outputs.end()) previous_outputs = oit->second;

  auto& s = TX(t).Mutable([project = pit->second, outputs = std::move(previous_outputs)](State& st) {
    st.projects[project.id] = project;
    if (!outputs.empty()) st.outputs[project.id] = outputs;
  });
  s.projects.erase(id);
  s.outputs.erase(id);
  return Result::Ok();
}

Result MemoryRepository::UpsertOutput(Transaction& t, const model::OutputRecord& r) {
  const auto& view = TX(t).View();
  if (!view.projects.contains(r.project_id)) return Result::Err(ErrorCode::NotFound, "project not found: " + r.project_id);

  std::optional<model::OutputRecord> previous;
  if (auto oit = view.outputs.find(r.project_id); oit != view.outputs.end()) {
    if (auto rit = oit->second.find(r.product_id); rit != oit->second.end()) previous = rit->second;
  }

  auto& s = TX(t).Mutable([project_id = r.project_id, product_id = r.product_id, previous](State& st) {
    if (previous) {
      st.outputs[project_id][product_id] = *previous;
    } else {
      st.outputs[project_id].erase(product_id);
    }
  });

  auto row = r;
  if (row.generated_at_ms == 0) row.generated_at_ms = util::NowMillis();
  row.created_at_ms = previous ? previous->created_at_ms : (row.created_at_ms ? row.created_at_ms : row.generated_at_ms);
  s.outputs[r.project_id][r.product_id] = std::move(row);
  return Result::Ok();
}

std::optional<model::OutputRecord> MemoryRepository::GetOutput(Transaction& t, const std::string& project_id, const std::string& product_id) {
  const auto& s   = TX(t).View();
  auto        oit = s.outputs.find(project_id);
  if (oit == s.outputs.end()) return std::nullopt;
  auto rit = oit->second.find(product_id);
  if (rit == oit->second.end()) return std::nullopt;
  return rit->second;
}

model::OutputPage MemoryRepository::PageOutputs(Transaction& t, const model::OutputQuery& q) {
  model::OutputPage page;
  const auto&       s   = TX(t).View();
  auto              oit = s.outputs.find(q.project_id);
  if (oit == s.outputs.end()) return page;

  std::vector<const model::OutputRecord*> matches;
  for (const auto& [product_id, row] : oit->second) {
    if (ContainsIgnoreCase(product_id, q.search)) matches.push_back(&row);
  }
  page.total    = oit->second.size();
  page.filtered = matches.size();

  std::sort(matches.begin(), matches.end(), [](const auto* a, const auto* b) {
    if (a->generated_at_ms != b->generated_at_ms) return a->generated_at_ms > b->generated_at_ms;
    return a->product_id < b->product_id;
  });

  for (uint64_t i = q.offset; i < matches.size() && page.rows.size() < q.limit; ++i) {
    page.rows.push_back(*matches[i]);
  }
  return page;
}

model::OutputCounts MemoryRepository::CountOutputs(Transaction& t, const std::string& project_id) {
  model::OutputCounts counts;
  for (const auto& [pid, rows] : TX(t).View().outputs) {
    if (!project_id.empty() && pid != project_id) continue;
    for (const auto& [_, row] : rows) {
      ++counts.total;
      if (row.status == framecomp::v1::OUTPUT_STATUS_SUCCEEDED) ++counts.succeeded;
      if (row.status == framecomp::v1::OUTPUT_STATUS_FAILED) ++counts.failed;
    }
  }
  return counts;
}

} // namespace framecomp::db::memory
