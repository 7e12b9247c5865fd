#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "jobkeep_core/types/job_id.hpp"

namespace jobkeep_core {

enum class JobState { PENDING, RUNNING, SUCCEEDED, FAILED };

inline std::string to_string(JobState state) {
  switch (state) {
    case JobState::PENDING: return "PENDING";
    case JobState::RUNNING: return "RUNNING";
    case JobState::SUCCEEDED: return "SUCCEEDED";
    case JobState::FAILED: return "FAILED";
  }
  return "UNKNOWN";
}

inline JobState job_state_from_string(const std::string& str) {
  if (str == "PENDING") return JobState::PENDING;
  if (str == "RUNNING") return JobState::RUNNING;
  if (str == "SUCCEEDED") return JobState::SUCCEEDED;
  if (str == "FAILED") return JobState::FAILED;
  throw std::invalid_argument("Invalid JobState string: " + str);
}

inline bool is_terminal(JobState state) {
  return state == JobState::SUCCEEDED || state == JobState::FAILED;
}

/**
 * @class JobStatus
 * @brief Tagged status of a job: PENDING, RUNNING, SUCCEEDED(result) or FAILED(error).
 *
 * Result and error values are held in their serialized JSON form so that any
 * backend can persist them. Typed access goes through result<T>() and
 * error<T>(), which use nlohmann's from_json for the caller's types.
 *
 * A FAILED status is "abnormal" when the failure did not come from the task's
 * own error value: the task threw, was discarded before running, or the
 * process exited while it was in flight. Abnormal errors are a string message.
 */
class JobStatus {
 public:
  JobStatus() = default;

  static JobStatus pending() {
    return JobStatus(JobState::PENDING, nullptr, false);
  }
  static JobStatus running() {
    return JobStatus(JobState::RUNNING, nullptr, false);
  }
  static JobStatus succeeded(nlohmann::json result) {
    return JobStatus(JobState::SUCCEEDED, std::move(result), false);
  }
  static JobStatus failed(nlohmann::json error) {
    return JobStatus(JobState::FAILED, std::move(error), false);
  }
  static JobStatus abnormal(const std::string& message) {
    return JobStatus(JobState::FAILED, message, true);
  }

  JobState state() const {
    return state_;
  }
  bool is_terminal() const {
    return jobkeep_core::is_terminal(state_);
  }
  bool is_abnormal() const {
    return abnormal_;
  }

  // Serialized result (SUCCEEDED) or error (FAILED); null otherwise.
  const nlohmann::json& payload() const {
    return payload_;
  }

  template <typename T>
  T result() const {
    if (state_ != JobState::SUCCEEDED) {
      throw std::logic_error("Job has no result in state " + to_string(state_));
    }
    return payload_.get<T>();
  }

  template <typename E>
  E error() const {
    if (state_ != JobState::FAILED) {
      throw std::logic_error("Job has no error in state " + to_string(state_));
    }
    return payload_.get<E>();
  }

  bool operator==(const JobStatus& other) const {
    return state_ == other.state_ && abnormal_ == other.abnormal_ && payload_ == other.payload_;
  }
  bool operator!=(const JobStatus& other) const {
    return !(*this == other);
  }

 private:
  JobStatus(JobState state, nlohmann::json payload, bool abnormal)
      : state_(state), payload_(std::move(payload)), abnormal_(abnormal) {}

  JobState state_ = JobState::PENDING;
  nlohmann::json payload_;
  bool abnormal_ = false;
};

struct JobRecord {
  JobId id;
  JobStatus status;
  nlohmann::json metadata;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;

  // Fresh PENDING record stamped with the current time.
  static JobRecord pending(const JobId& id, nlohmann::json metadata = nullptr);

  // Copy of this record moved to `next`, with updated_at refreshed.
  JobRecord with_status(JobStatus next) const;
};

struct JobProgress {
  JobId job_id;
  float progress_percent = 0.0f;
  std::string status_message;
  std::chrono::system_clock::time_point updated_at;
};

// UTC, second resolution: "YYYY-MM-DD HH:MM:SS"
std::string time_point_to_string(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str);

// Document layout shared by the filesystem backend and the CLI. from_json
// throws std::invalid_argument or nlohmann::json::exception on malformed input.
void to_json(nlohmann::json& j, const JobRecord& record);
void from_json(const nlohmann::json& j, JobRecord& record);
void to_json(nlohmann::json& j, const JobProgress& progress);
void from_json(const nlohmann::json& j, JobProgress& progress);

}  // namespace jobkeep_core
