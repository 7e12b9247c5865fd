#include "jobkeep_core/store/fs_job_store.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace jobkeep_core {

namespace {

constexpr const char* kRecordSuffix = ".json";
constexpr const char* kProgressSuffix = ".progress.json";

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string next_temp_suffix() {
  static std::atomic<uint64_t> counter{0};
  return ".tmp-" + std::to_string(getpid()) + "-" + std::to_string(counter.fetch_add(1));
}

// Strings holding invalid UTF-8 make dump() throw.
template <typename T>
std::string encode(const T& value, const std::string& what) {
  try {
    nlohmann::json doc = value;
    return doc.dump();
  } catch (const nlohmann::json::exception& e) {
    throw StoreError(StoreErrorKind::CORRUPT, "Cannot encode " + what + ": " + e.what());
  }
}

}  // namespace

FsJobStore::FsJobStore(const std::filesystem::path& job_directory)
    : job_directory_(job_directory) {
  std::error_code ec;
  std::filesystem::create_directories(job_directory_, ec);
  if (ec) {
    throw StoreError(StoreErrorKind::IO_FAILURE,
                     "Failed to create job directory " + job_directory_.string() + ": " +
                         ec.message());
  }
}

std::filesystem::path FsJobStore::record_path(const JobId& id) const {
  return job_directory_ / (id.str() + kRecordSuffix);
}

std::filesystem::path FsJobStore::progress_path(const JobId& id) const {
  return job_directory_ / (id.str() + kProgressSuffix);
}

void FsJobStore::save(const JobRecord& record) {
  if (!record.id.is_storage_safe()) {
    throw StoreError(StoreErrorKind::IO_FAILURE,
                     "Refusing to save job with unsafe id '" + record.id.str() + "'");
  }
  write_atomically(record_path(record.id), encode(record, "job " + record.id.str()));
}

JobRecord FsJobStore::load(const JobId& id) {
  if (!id.is_storage_safe()) {
    throw StoreError(StoreErrorKind::NOT_FOUND, "No job record for id " + id.str());
  }
  std::optional<std::string> contents = read_file(record_path(id));
  if (!contents) {
    throw StoreError(StoreErrorKind::NOT_FOUND, "No job record for id " + id.str());
  }

  JobRecord record;
  try {
    record = nlohmann::json::parse(*contents).get<JobRecord>();
  } catch (const nlohmann::json::exception& e) {
    throw StoreError(StoreErrorKind::CORRUPT,
                     "Malformed job record " + record_path(id).string() + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw StoreError(StoreErrorKind::CORRUPT,
                     "Malformed job record " + record_path(id).string() + ": " + e.what());
  }

  if (record.id != id) {
    throw StoreError(StoreErrorKind::CORRUPT, "Job record " + record_path(id).string() +
                                                  " belongs to id " + record.id.str());
  }
  return record;
}

void FsJobStore::save_progress(const JobProgress& progress) {
  if (!progress.job_id.is_storage_safe()) {
    throw StoreError(StoreErrorKind::IO_FAILURE,
                     "Refusing to save progress for unsafe id '" + progress.job_id.str() + "'");
  }
  write_atomically(progress_path(progress.job_id),
                   encode(progress, "progress of job " + progress.job_id.str()));
}

std::optional<JobProgress> FsJobStore::load_progress(const JobId& id) {
  if (!id.is_storage_safe()) {
    return std::nullopt;
  }
  std::optional<std::string> contents = read_file(progress_path(id));
  if (!contents) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(*contents).get<JobProgress>();
  } catch (const nlohmann::json::exception& e) {
    throw StoreError(StoreErrorKind::CORRUPT,
                     "Malformed progress file " + progress_path(id).string() + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw StoreError(StoreErrorKind::CORRUPT,
                     "Malformed progress file " + progress_path(id).string() + ": " + e.what());
  }
}

std::vector<JobRecord> FsJobStore::list_by_state(JobState state) {
  std::vector<JobRecord> records;
  std::error_code ec;
  std::filesystem::directory_iterator it(job_directory_, ec);
  if (ec) {
    throw StoreError(StoreErrorKind::IO_FAILURE,
                     "Failed to list " + job_directory_.string() + ": " + ec.message());
  }

  for (const auto& entry : it) {
    const std::string name = entry.path().filename().string();
    if (name.empty() || name[0] == '.' || ends_with(name, kProgressSuffix) ||
        !ends_with(name, kRecordSuffix)) {
      continue;
    }
    JobId id(name.substr(0, name.size() - std::string(kRecordSuffix).size()));
    try {
      JobRecord record = load(id);
      if (record.status.state() == state) {
        records.push_back(std::move(record));
      }
    } catch (const StoreError& e) {
      if (e.kind() == StoreErrorKind::IO_FAILURE) {
        throw;
      }
      // Corrupt or vanished entries do not block listing the rest.
      std::cerr << "FsJobStore: skipping " << name << ": " << e.what() << std::endl;
    }
  }

  std::sort(records.begin(), records.end(), [](const JobRecord& a, const JobRecord& b) {
    return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
  });
  return records;
}

void FsJobStore::write_atomically(const std::filesystem::path& target,
                                  const std::string& contents) const {
  std::filesystem::path temp = target.parent_path() /
                               ("." + target.filename().string() + next_temp_suffix());
  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError(StoreErrorKind::IO_FAILURE, "Failed to open " + temp.string());
    }
    file << contents;
    file.flush();
    if (!file.good()) {
      file.close();
      std::error_code ignored;
      std::filesystem::remove(temp, ignored);
      throw StoreError(StoreErrorKind::IO_FAILURE, "Failed to write " + temp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    throw StoreError(StoreErrorKind::IO_FAILURE,
                     "Failed to publish " + target.string() + ": " + ec.message());
  }
}

std::optional<std::string> FsJobStore::read_file(const std::filesystem::path& path) const {
  std::error_code ec;
  bool present = std::filesystem::exists(path, ec);
  if (ec) {
    throw StoreError(StoreErrorKind::IO_FAILURE,
                     "Failed to stat " + path.string() + ": " + ec.message());
  }
  if (!present) {
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StoreError(StoreErrorKind::IO_FAILURE, "Failed to open " + path.string());
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  if (file.bad()) {
    throw StoreError(StoreErrorKind::IO_FAILURE, "Failed to read " + path.string());
  }
  return ss.str();
}

}  // namespace jobkeep_core
