#include "jobkeep_core/types/job_record.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace jobkeep_core {

JobRecord JobRecord::pending(const JobId& id, nlohmann::json metadata) {
  JobRecord record;
  record.id = id;
  record.status = JobStatus::pending();
  record.metadata = std::move(metadata);
  record.created_at = std::chrono::system_clock::now();
  record.updated_at = record.created_at;
  return record;
}

JobRecord JobRecord::with_status(JobStatus next) const {
  JobRecord record = *this;
  record.status = std::move(next);
  record.updated_at = std::chrono::system_clock::now();
  return record;
}

std::string time_point_to_string(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw std::invalid_argument("Invalid timestamp: " + time_str);
  }
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

void to_json(nlohmann::json& j, const JobRecord& record) {
  j = nlohmann::json{{"id", record.id.str()},
                     {"state", to_string(record.status.state())},
                     {"metadata", record.metadata},
                     {"created_at", time_point_to_string(record.created_at)},
                     {"updated_at", time_point_to_string(record.updated_at)}};
  if (record.status.state() == JobState::SUCCEEDED) {
    j["result"] = record.status.payload();
  } else if (record.status.state() == JobState::FAILED) {
    j["error"] = record.status.payload();
    j["abnormal"] = record.status.is_abnormal();
  }
}

void from_json(const nlohmann::json& j, JobRecord& record) {
  record.id = JobId(j.at("id").get<std::string>());
  if (record.id.empty()) {
    throw std::invalid_argument("Job record has an empty id");
  }

  JobState state = job_state_from_string(j.at("state").get<std::string>());
  switch (state) {
    case JobState::PENDING:
      record.status = JobStatus::pending();
      break;
    case JobState::RUNNING:
      record.status = JobStatus::running();
      break;
    case JobState::SUCCEEDED:
      record.status = JobStatus::succeeded(j.at("result"));
      break;
    case JobState::FAILED:
      if (j.value("abnormal", false)) {
        record.status = JobStatus::abnormal(j.at("error").get<std::string>());
      } else {
        record.status = JobStatus::failed(j.at("error"));
      }
      break;
  }

  record.metadata = j.value("metadata", nlohmann::json());
  record.created_at = string_to_time_point(j.at("created_at").get<std::string>());
  record.updated_at = string_to_time_point(j.at("updated_at").get<std::string>());
}

void to_json(nlohmann::json& j, const JobProgress& progress) {
  j = nlohmann::json{{"job_id", progress.job_id.str()},
                     {"progress_percent", progress.progress_percent},
                     {"status_message", progress.status_message},
                     {"updated_at", time_point_to_string(progress.updated_at)}};
}

void from_json(const nlohmann::json& j, JobProgress& progress) {
  progress.job_id = JobId(j.at("job_id").get<std::string>());
  progress.progress_percent = j.at("progress_percent").get<float>();
  progress.status_message = j.at("status_message").get<std::string>();
  progress.updated_at = string_to_time_point(j.at("updated_at").get<std::string>());
}

}  // namespace jobkeep_core
