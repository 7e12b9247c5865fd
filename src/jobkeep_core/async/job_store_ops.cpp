#include "jobkeep_core/async/job_store_ops.hpp"

#include <iostream>
#include <thread>

namespace jobkeep_core {

JobRecord load_job(JobStore& store, const JobId& id) {
  try {
    return store.load(id);
  } catch (const StoreError& e) {
    if (e.kind() == StoreErrorKind::NOT_FOUND) {
      throw LoadError(LoadErrorKind::UNKNOWN_JOB, id, "Unknown job " + id.str());
    }
    throw LoadError(LoadErrorKind::BACKEND_ERROR, id,
                    "Failed to load job " + id.str() + " (" + to_string(e.kind()) + "): " + e.what());
  }
}

std::optional<JobRecord> wait_for_terminal(JobStore& store,
                                           const JobId& id,
                                           std::chrono::milliseconds timeout,
                                           std::chrono::milliseconds poll_interval) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    JobRecord record = load_job(store, id);
    if (record.status.is_terminal()) {
      return record;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(poll_interval);
  }
}

std::size_t fail_interrupted_jobs(JobStore& store) {
  std::size_t count = 0;
  for (JobState state : {JobState::PENDING, JobState::RUNNING}) {
    for (const JobRecord& record : store.list_by_state(state)) {
      store.save(record.with_status(
          JobStatus::abnormal("interrupted: the process running this job exited before it completed")));
      std::cout << "Recovery: marked interrupted job " << record.id << " as FAILED" << std::endl;
      ++count;
    }
  }
  return count;
}

}  // namespace jobkeep_core
