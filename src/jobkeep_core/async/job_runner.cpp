#include "jobkeep_core/async/job_runner.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>

#include "jobkeep_core/async/job_store_ops.hpp"

namespace jobkeep_core {

namespace detail {

// Shared between the runner and every posted job, so jobs can finish
// persisting after the runner is gone.
struct RunnerState {
  RunnerState(std::shared_ptr<JobStore> s, RunnerOptions o)
      : store(std::move(s)), options(std::move(o)) {}

  std::shared_ptr<JobStore> store;
  RunnerOptions options;

  std::atomic<uint64_t> submitted{0};
  std::atomic<uint64_t> rejected{0};
  std::atomic<uint64_t> succeeded{0};
  std::atomic<uint64_t> failed{0};
  std::atomic<uint64_t> abnormal{0};
  std::atomic<uint64_t> running_save_failures{0};
  std::atomic<uint64_t> terminal_save_failures{0};
  std::atomic<uint64_t> progress_save_failures{0};
};

}  // namespace detail

namespace {

constexpr int kMaxIdDraws = 3;

void report_lost_terminal(detail::RunnerState& state, const JobId& id, const std::string& message) {
  state.terminal_save_failures++;
  std::cerr << "JobRunner: ERROR lost terminal status of job " << id << ": " << message << std::endl;
  if (!state.options.on_persistence_error) {
    return;
  }
  try {
    state.options.on_persistence_error(id, message);
  } catch (const std::exception& e) {
    std::cerr << "JobRunner: persistence error handler threw: " << e.what() << std::endl;
  }
}

struct SaveFailure {
  bool io_failure;
  std::string message;
};

// Saves with retries on IO_FAILURE. nullopt on success.
std::optional<SaveFailure> save_with_retry(detail::RunnerState& state, const JobRecord& record) {
  const int attempts = state.options.terminal_save_attempts;
  for (int attempt = 1;; ++attempt) {
    try {
      state.store->save(record);
      return std::nullopt;
    } catch (const StoreError& e) {
      const bool io_failure = e.kind() == StoreErrorKind::IO_FAILURE;
      if (!io_failure || attempt >= attempts) {
        return SaveFailure{io_failure, to_string(e.kind()) + " after " + std::to_string(attempt) +
                                           " attempt(s): " + e.what()};
      }
      std::cerr << "JobRunner: terminal save of job " << record.id << " failed (attempt "
                << attempt << "/" << attempts << "), retrying: " << e.what() << std::endl;
    } catch (const std::exception& e) {
      return SaveFailure{false, e.what()};
    }
    std::this_thread::sleep_for(state.options.terminal_save_retry_delay * attempt);
  }
}

void persist_terminal(detail::RunnerState& state, const JobRecord& record) {
  std::optional<SaveFailure> failure = save_with_retry(state, record);
  if (!failure) {
    return;
  }
  if (failure->io_failure) {
    report_lost_terminal(state, record.id, failure->message);
    return;
  }

  // The store refused this status. Record a plain abnormal failure instead.
  JobRecord fallback =
      record.with_status(JobStatus::abnormal("terminal status was rejected by the store"));
  std::optional<SaveFailure> fallback_failure = save_with_retry(state, fallback);
  if (fallback_failure) {
    report_lost_terminal(state, record.id,
                         failure->message + "; fallback record also failed: " +
                             fallback_failure->message);
  } else {
    report_lost_terminal(state, record.id,
                         failure->message + "; recorded FAILED (abnormal) instead");
  }
}

// Strings with invalid UTF-8 cannot be serialized by any backend. Such a
// status becomes an abnormal failure with an ASCII message.
JobStatus ensure_encodable(JobStatus status) {
  try {
    (void)status.payload().dump();
    return status;
  } catch (const nlohmann::json::exception& e) {
    const std::string what = status.is_abnormal()                     ? "failure message"
                             : status.state() == JobState::SUCCEEDED ? "task result"
                                                                     : "task error";
    return JobStatus::abnormal(what + " could not be encoded: " + e.what());
  }
}

/**
 * @class JobEnvelope
 * @brief One submitted job: its body, its last persisted record, and the
 * guard that guarantees a terminal write.
 *
 * Exactly one of run(), reject() or the destructor persists the terminal
 * status.
 */
class JobEnvelope {
 public:
  JobEnvelope(std::shared_ptr<detail::RunnerState> state,
              JobRecord record,
              std::function<JobStatus(JobContext&)> body)
      : state_(std::move(state)), record_(std::move(record)), body_(std::move(body)) {}

  ~JobEnvelope() {
    if (!finished_.load()) {
      std::cerr << "JobRunner: job " << record_.id << " was discarded before it ran" << std::endl;
      finish(JobStatus::abnormal("discarded: the executor destroyed the job before running it"));
    }
  }

  JobEnvelope(const JobEnvelope&) = delete;
  JobEnvelope& operator=(const JobEnvelope&) = delete;

  void run() {
    JobStatus status;
    try {
      JobContext ctx(record_.id, record_.metadata, progress_updater());
      status = body_(ctx);
      if (!status.is_terminal()) {
        status = JobStatus::abnormal("task returned non-terminal status " + to_string(status.state()));
      }
    } catch (const std::exception& e) {
      status = JobStatus::abnormal(std::string("task threw: ") + e.what());
    } catch (...) {
      status = JobStatus::abnormal("task threw a non-standard exception");
    }
    finish(std::move(status));
  }

  void reject(const std::string& reason) {
    state_->rejected++;
    finish(JobStatus::abnormal("rejected: " + reason));
  }

 private:
  ProgressUpdater progress_updater() const {
    std::shared_ptr<detail::RunnerState> state = state_;
    JobId id = record_.id;
    return [state, id](float percent, const std::string& message) {
      JobProgress progress;
      progress.job_id = id;
      progress.progress_percent = std::isfinite(percent) ? std::clamp(percent, 0.0f, 1.0f) : 0.0f;
      progress.status_message = message;
      progress.updated_at = std::chrono::system_clock::now();
      try {
        state->store->save_progress(progress);
      } catch (const std::exception& e) {
        state->progress_save_failures++;
        std::cerr << "JobRunner: progress save of job " << id << " failed: " << e.what()
                  << std::endl;
      }
    };
  }

  void finish(JobStatus status) {
    if (finished_.exchange(true)) {
      return;
    }
    status = ensure_encodable(std::move(status));
    if (status.is_abnormal()) {
      state_->abnormal++;
    } else if (status.state() == JobState::SUCCEEDED) {
      state_->succeeded++;
    } else {
      state_->failed++;
    }
    persist_terminal(*state_, record_.with_status(std::move(status)));
  }

  std::shared_ptr<detail::RunnerState> state_;
  JobRecord record_;
  std::function<JobStatus(JobContext&)> body_;
  std::atomic<bool> finished_{false};
};

}  // namespace

JobRunner::JobRunner(std::shared_ptr<JobStore> store,
                     std::shared_ptr<async::JobExecutor> executor,
                     std::shared_ptr<JobIdGenerator> id_generator,
                     RunnerOptions options)
    : executor_(std::move(executor)), id_generator_(std::move(id_generator)) {
  if (!store) {
    throw std::invalid_argument("JobRunner requires a JobStore");
  }
  if (!executor_) {
    throw std::invalid_argument("JobRunner requires a JobExecutor");
  }
  if (!id_generator_) {
    throw std::invalid_argument("JobRunner requires a JobIdGenerator");
  }
  if (options.terminal_save_attempts < 2) {
    throw std::invalid_argument("terminal_save_attempts must be at least 2");
  }
  if (options.terminal_save_retry_delay.count() < 0) {
    throw std::invalid_argument("terminal_save_retry_delay must not be negative");
  }
  const bool recover = options.recover_interrupted_on_start;
  state_ = std::make_shared<detail::RunnerState>(std::move(store), std::move(options));

  if (recover) {
    size_t count = recover_interrupted_jobs();
    std::cout << "JobRunner: recovered " << count << " interrupted job(s)" << std::endl;
  }
}

JobId JobRunner::submit_job(std::function<JobStatus(JobContext&)> body, nlohmann::json metadata) {
  if (!body) {
    throw std::invalid_argument("JobRunner::submit requires a task");
  }
  {
    std::lock_guard<std::mutex> lock(startup_mutex_);
    accepted_submission_ = true;
  }

  JobRecord record = JobRecord::pending(allocate_id(), std::move(metadata));
  try {
    state_->store->save(record);
  } catch (const std::exception& e) {
    throw SubmitError(SubmitErrorKind::PERSISTENCE_ERROR,
                      "Failed to persist job " + record.id.str() + ": " + e.what());
  }
  state_->submitted++;

  record = record.with_status(JobStatus::running());
  try {
    state_->store->save(record);
  } catch (const std::exception& e) {
    state_->running_save_failures++;
    std::cerr << "JobRunner: WARNING failed to persist RUNNING for job " << record.id << ": "
              << e.what() << std::endl;
  }

  const JobId id = record.id;
  auto envelope = std::make_shared<JobEnvelope>(state_, std::move(record), std::move(body));
  try {
    executor_->post([envelope]() { envelope->run(); });
  } catch (const std::exception& e) {
    std::cerr << "JobRunner: executor rejected job " << id << ": " << e.what() << std::endl;
    envelope->reject(e.what());
  }
  return id;
}

JobId JobRunner::allocate_id() {
  for (int draw = 1; draw <= kMaxIdDraws; ++draw) {
    JobId id;
    try {
      id = id_generator_->next();
    } catch (const std::exception& e) {
      throw SubmitError(SubmitErrorKind::ID_GENERATION_ERROR,
                        std::string("Id generator failed: ") + e.what());
    }
    if (!id.is_storage_safe()) {
      throw SubmitError(SubmitErrorKind::ID_GENERATION_ERROR,
                        "Id generator produced an unusable id '" + id.str() + "'");
    }
    if (!state_->options.verify_unique_ids) {
      return id;
    }

    try {
      state_->store->load(id);
    } catch (const StoreError& e) {
      if (e.kind() == StoreErrorKind::NOT_FOUND) {
        return id;
      }
      throw SubmitError(SubmitErrorKind::PERSISTENCE_ERROR,
                        "Store unavailable while checking id " + id.str() + ": " + e.what());
    }
    std::cerr << "JobRunner: WARNING generated id " << id << " already has a record (draw "
              << draw << "/" << kMaxIdDraws << ")" << std::endl;
  }
  throw SubmitError(SubmitErrorKind::ID_GENERATION_ERROR,
                    "Id generator produced " + std::to_string(kMaxIdDraws) + " ids already in use");
}

JobRecord JobRunner::load(const JobId& id) const {
  return load_job(*state_->store, id);
}

std::optional<JobProgress> JobRunner::load_progress(const JobId& id) const {
  try {
    return state_->store->load_progress(id);
  } catch (const StoreError& e) {
    throw LoadError(LoadErrorKind::BACKEND_ERROR, id,
                    "Failed to load progress of job " + id.str() + ": " + e.what());
  }
}

std::optional<JobRecord> JobRunner::wait(const JobId& id,
                                         std::chrono::milliseconds timeout,
                                         std::chrono::milliseconds poll_interval) const {
  return wait_for_terminal(*state_->store, id, timeout, poll_interval);
}

size_t JobRunner::recover_interrupted_jobs() {
  std::lock_guard<std::mutex> lock(startup_mutex_);
  if (accepted_submission_) {
    throw std::logic_error("recover_interrupted_jobs must run before the first submission");
  }
  return fail_interrupted_jobs(*state_->store);
}

RunnerStats JobRunner::stats() const {
  RunnerStats s;
  s.submitted = state_->submitted.load();
  s.rejected = state_->rejected.load();
  s.succeeded = state_->succeeded.load();
  s.failed = state_->failed.load();
  s.abnormal = state_->abnormal.load();
  s.running_save_failures = state_->running_save_failures.load();
  s.terminal_save_failures = state_->terminal_save_failures.load();
  s.progress_save_failures = state_->progress_save_failures.load();
  return s;
}

}  // namespace jobkeep_core
