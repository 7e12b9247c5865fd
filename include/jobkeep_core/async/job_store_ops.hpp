#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

#include "jobkeep_core/async/job_errors.hpp"
#include "jobkeep_core/store/job_store.hpp"

namespace jobkeep_core {

// Reads the persisted record. NOT_FOUND becomes LoadError(UNKNOWN_JOB), every
// other store failure LoadError(BACKEND_ERROR).
JobRecord load_job(JobStore& store, const JobId& id);

// Polls load_job until the record is terminal. nullopt when the timeout
// expires first. LoadError propagates.
std::optional<JobRecord> wait_for_terminal(
    JobStore& store,
    const JobId& id,
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(10));

// Marks every PENDING or RUNNING record as an abnormal failure. Only valid
// while no process is running jobs against this store: after a restart, such
// records belong to a process that exited and can no longer complete.
// Returns the number of records rewritten. StoreError propagates.
std::size_t fail_interrupted_jobs(JobStore& store);

}  // namespace jobkeep_core
