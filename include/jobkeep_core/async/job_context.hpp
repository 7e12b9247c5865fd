#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "jobkeep_core/types/job_id.hpp"

namespace jobkeep_core {

using ProgressUpdater = std::function<void(float, const std::string&)>;

// Handed to a running task: who it is, what the submitter attached, and a way
// to publish progress while it runs.
class JobContext {
 public:
  JobContext(JobId id, const nlohmann::json& metadata, ProgressUpdater on_progress)
      : id_(std::move(id)), metadata_(metadata), on_progress_(std::move(on_progress)) {}

  const JobId& id() const {
    return id_;
  }
  const nlohmann::json& metadata() const {
    return metadata_;
  }

  // Best effort; a failed progress write never fails the job.
  void report_progress(float percent, const std::string& message) const {
    if (on_progress_) {
      on_progress_(percent, message);
    }
  }

 private:
  JobId id_;
  const nlohmann::json& metadata_;
  ProgressUpdater on_progress_;
};

}  // namespace jobkeep_core
