#include "jobkeep_core/store/memory_job_store.hpp"

#include <algorithm>

namespace jobkeep_core {

void MemoryJobStore::save(const JobRecord& record) {
  std::lock_guard<std::mutex> lock(mtx_);
  records_[record.id] = record;
}

JobRecord MemoryJobStore::load(const JobId& id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    throw StoreError(StoreErrorKind::NOT_FOUND, "No job record for id " + id.str());
  }
  return it->second;
}

void MemoryJobStore::save_progress(const JobProgress& progress) {
  std::lock_guard<std::mutex> lock(mtx_);
  progress_[progress.job_id] = progress;
}

std::optional<JobProgress> MemoryJobStore::load_progress(const JobId& id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = progress_.find(id);
  if (it == progress_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<JobRecord> MemoryJobStore::list_by_state(JobState state) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<JobRecord> records;
  for (const auto& entry : records_) {
    if (entry.second.status.state() == state) {
      records.push_back(entry.second);
    }
  }
  std::sort(records.begin(), records.end(),
            [](const JobRecord& a, const JobRecord& b) { return a.created_at < b.created_at; });
  return records;
}

std::size_t MemoryJobStore::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return records_.size();
}

}  // namespace jobkeep_core
