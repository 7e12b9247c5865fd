#pragma once

#include <mutex>
#include <unordered_map>

#include "jobkeep_core/store/job_store.hpp"

namespace jobkeep_core {

// Process-local store. Nothing survives the instance; used by tests and by
// runners that only need in-process tracking.
class MemoryJobStore : public JobStore {
 public:
  MemoryJobStore() = default;

  void save(const JobRecord& record) override;
  JobRecord load(const JobId& id) override;
  void save_progress(const JobProgress& progress) override;
  std::optional<JobProgress> load_progress(const JobId& id) override;
  std::vector<JobRecord> list_by_state(JobState state) override;

  std::size_t size() const;

 private:
  mutable std::mutex mtx_;
  std::unordered_map<JobId, JobRecord> records_;
  std::unordered_map<JobId, JobProgress> progress_;
};

}  // namespace jobkeep_core
