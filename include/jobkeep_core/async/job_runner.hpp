#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "jobkeep_core/async/id_generator.hpp"
#include "jobkeep_core/async/job_context.hpp"
#include "jobkeep_core/async/job_errors.hpp"
#include "jobkeep_core/async/job_executor.hpp"
#include "jobkeep_core/store/job_store.hpp"
#include "jobkeep_core/types/job_outcome.hpp"
#include "jobkeep_core/types/job_record.hpp"

namespace jobkeep_core {

using PersistenceErrorHandler = std::function<void(const JobId&, const std::string&)>;

struct RunnerOptions {
  // Total attempts for the terminal write, retried on IO_FAILURE only
  int terminal_save_attempts = 3;
  // Backoff before retry n is n * terminal_save_retry_delay
  std::chrono::milliseconds terminal_save_retry_delay{50};
  // Check the store for an existing record before using a generated id
  bool verify_unique_ids = true;
  bool recover_interrupted_on_start = false;
  // Called from the worker thread when a job's terminal status could not be
  // persisted. The store then holds RUNNING or an abnormal FAILED fallback.
  PersistenceErrorHandler on_persistence_error;
};

// Statistics snapshot
struct RunnerStats {
  uint64_t submitted = 0;
  uint64_t rejected = 0;  // refused by the executor
  uint64_t succeeded = 0;
  uint64_t failed = 0;    // caller error values
  uint64_t abnormal = 0;  // threw, discarded, rejected
  uint64_t running_save_failures = 0;
  uint64_t terminal_save_failures = 0;
  uint64_t progress_save_failures = 0;
};

namespace detail {
struct RunnerState;
}

/**
 * @class JobRunner
 * @brief Runs jobs on an executor and keeps their status in a JobStore.
 *
 * submit() allocates an id, persists PENDING then RUNNING, posts the work
 * and returns without waiting. The worker persists the terminal status when
 * the work finishes. load() always reads the store, so the status survives
 * restarts of both the runner and the process.
 *
 * Work that throws, or that the executor destroys without running, still ends
 * FAILED (abnormal). Jobs already posted keep running and persisting after
 * the runner itself is destroyed.
 */
class JobRunner {
 public:
  JobRunner(std::shared_ptr<JobStore> store,
            std::shared_ptr<async::JobExecutor> executor,
            std::shared_ptr<JobIdGenerator> id_generator = std::make_shared<UuidJobIdGenerator>(),
            RunnerOptions options = RunnerOptions());

  JobRunner(const JobRunner&) = delete;
  JobRunner& operator=(const JobRunner&) = delete;

  /**
   * @brief Submits work returning a JobOutcome<T, E>.
   *
   * work is called on a worker thread with a JobContext& or, if it does not
   * accept one, with the job's const JobId&. T and E need nlohmann JSON
   * conversions.
   *
   * @return The new job's id. The job has at least a PENDING record.
   * @throws SubmitError when no id could be allocated or PENDING was not
   *         persisted. Nothing was scheduled in that case.
   */
  template <typename Fn>
  JobId submit(Fn work, nlohmann::json metadata = nlohmann::json()) {
    return submit_job(
        [work = std::move(work)](JobContext& ctx) mutable -> JobStatus {
          if constexpr (std::is_invocable_v<Fn&, JobContext&>) {
            return to_job_status(work(ctx));
          } else {
            return to_job_status(work(ctx.id()));
          }
        },
        std::move(metadata));
  }

  // Untyped form of submit(). body must return a terminal status; any other
  // status is recorded as an abnormal failure.
  JobId submit_job(std::function<JobStatus(JobContext&)> body,
                   nlohmann::json metadata = nlohmann::json());

  // Current persisted record. Throws LoadError.
  JobRecord load(const JobId& id) const;

  // Last progress the job reported, nullopt if none. Throws LoadError(BACKEND_ERROR).
  std::optional<JobProgress> load_progress(const JobId& id) const;

  // Blocks until the job is terminal or the timeout expires (nullopt).
  std::optional<JobRecord> wait(
      const JobId& id,
      std::chrono::milliseconds timeout,
      std::chrono::milliseconds poll_interval = std::chrono::milliseconds(10)) const;

  /**
   * @brief Fails every PENDING or RUNNING record left by a previous process.
   *
   * Startup only: throws std::logic_error once this runner has accepted a
   * submission. StoreError propagates.
   *
   * @return Number of records marked FAILED.
   */
  size_t recover_interrupted_jobs();

  RunnerStats stats() const;

 private:
  JobId allocate_id();

  std::shared_ptr<detail::RunnerState> state_;
  std::shared_ptr<async::JobExecutor> executor_;
  std::shared_ptr<JobIdGenerator> id_generator_;

  std::mutex startup_mutex_;
  bool accepted_submission_ = false;
};

}  // namespace jobkeep_core
