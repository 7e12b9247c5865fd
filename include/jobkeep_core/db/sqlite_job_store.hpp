#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "jobkeep_core/db/database_manager.hpp"
#include "jobkeep_core/store/job_store.hpp"

namespace jobkeep_core {

// Job records in SQLite: one row per job in job_records, upserted on save.
class SqliteJobStore : public JobStore {
 public:
  // db_manager must already be initialized.
  explicit SqliteJobStore(std::shared_ptr<DatabaseManager> db_manager);

  void save(const JobRecord& record) override;
  JobRecord load(const JobId& id) override;
  void save_progress(const JobProgress& progress) override;
  std::optional<JobProgress> load_progress(const JobId& id) override;
  std::vector<JobRecord> list_by_state(JobState state) override;

  // Retention: drops SUCCEEDED/FAILED records (and their progress rows) whose
  // last update is older than the cutoff. Returns the number of records removed.
  std::size_t clear_terminal_records(int older_than_days = 7);

 private:
  struct RecordRow {
    std::string id;
    std::string state;
    std::string payload;
    int abnormal = 0;
    std::string metadata;
    std::string created_at;
    std::string updated_at;
  };

  static JobRecord decode_record(const RecordRow& row);

  std::shared_ptr<DatabaseManager> db_manager_;
};

}  // namespace jobkeep_core
