#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "jobkeep_core/store/job_store.hpp"

namespace jobkeep_core {

/**
 * @class FsJobStore
 * @brief Stores each job as a JSON document in a directory.
 *
 * Layout:
 *   <dir>/<id>.json           job record
 *   <dir>/<id>.progress.json  latest progress report
 *
 * Every write goes to a hidden temp file in the same directory and is renamed
 * over the target, so readers see either the old or the new document.
 */
class FsJobStore : public JobStore {
 public:
  // Creates the directory if needed. Throws StoreError(IO_FAILURE) if it cannot.
  explicit FsJobStore(const std::filesystem::path& job_directory);

  void save(const JobRecord& record) override;
  JobRecord load(const JobId& id) override;
  void save_progress(const JobProgress& progress) override;
  std::optional<JobProgress> load_progress(const JobId& id) override;
  std::vector<JobRecord> list_by_state(JobState state) override;

  const std::filesystem::path& directory() const {
    return job_directory_;
  }

 private:
  std::filesystem::path record_path(const JobId& id) const;
  std::filesystem::path progress_path(const JobId& id) const;

  void write_atomically(const std::filesystem::path& target, const std::string& contents) const;
  // nullopt when the file does not exist
  std::optional<std::string> read_file(const std::filesystem::path& path) const;

  std::filesystem::path job_directory_;
};

}  // namespace jobkeep_core
