#include "jobkeep_core/db/sqlite_job_store.hpp"

#include <sqlite_modern_cpp.h>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "jobkeep_core/db/pooled_connection.hpp"
#include "jobkeep_core/db/sqlite_error_utils.hpp"
#include "jobkeep_core/db/transaction.hpp"

namespace jobkeep_core {

SqliteJobStore::SqliteJobStore(std::shared_ptr<DatabaseManager> db_manager)
    : db_manager_(std::move(db_manager)) {
  if (!db_manager_ || !db_manager_->is_initialized()) {
    throw std::invalid_argument("SqliteJobStore requires an initialized DatabaseManager.");
  }
}

JobRecord SqliteJobStore::decode_record(const RecordRow& row) {
  JobRecord record;
  record.id = JobId(row.id);

  nlohmann::json payload = nlohmann::json::parse(row.payload);
  switch (job_state_from_string(row.state)) {
    case JobState::PENDING:
      record.status = JobStatus::pending();
      break;
    case JobState::RUNNING:
      record.status = JobStatus::running();
      break;
    case JobState::SUCCEEDED:
      record.status = JobStatus::succeeded(std::move(payload));
      break;
    case JobState::FAILED:
      record.status = row.abnormal != 0 ? JobStatus::abnormal(payload.get<std::string>())
                                        : JobStatus::failed(std::move(payload));
      break;
  }
  record.metadata = nlohmann::json::parse(row.metadata);
  record.created_at = string_to_time_point(row.created_at);
  record.updated_at = string_to_time_point(row.updated_at);
  return record;
}

void SqliteJobStore::save(const JobRecord& record) {
  try {
    std::string payload = record.status.payload().dump();
    std::string metadata = record.metadata.dump();
    PooledConnection conn(*db_manager_);
    *conn << "INSERT INTO job_records (id, state, payload, abnormal, metadata, created_at, "
             "updated_at) VALUES (?,?,?,?,?,?,?) "
             "ON CONFLICT(id) DO UPDATE SET state = excluded.state, payload = excluded.payload, "
             "abnormal = excluded.abnormal, metadata = excluded.metadata, "
             "updated_at = excluded.updated_at"
          << record.id.str() << to_string(record.status.state()) << payload
          << (record.status.is_abnormal() ? 1 : 0) << metadata
          << time_point_to_string(record.created_at) << time_point_to_string(record.updated_at);
  } catch (const sqlite::sqlite_exception& e) {
    throw to_store_error("save", e);
  } catch (const nlohmann::json::exception& e) {
    throw StoreError(StoreErrorKind::CORRUPT,
                     "save failed: record " + record.id.str() + " cannot be encoded: " + e.what());
  } catch (const std::runtime_error& e) {
    throw StoreError(StoreErrorKind::IO_FAILURE, std::string("save failed: ") + e.what());
  }
}

JobRecord SqliteJobStore::load(const JobId& id) {
  std::optional<RecordRow> row;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT id, state, payload, abnormal, metadata, created_at, updated_at "
             "FROM job_records WHERE id = ?"
          << id.str() >>
        [&](std::string row_id, std::string state, std::string payload, int abnormal,
            std::string metadata, std::string created_at, std::string updated_at) {
          row = RecordRow{row_id, state, payload, abnormal, metadata, created_at, updated_at};
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw to_store_error("load", e);
  } catch (const std::runtime_error& e) {
    throw StoreError(StoreErrorKind::IO_FAILURE, std::string("load failed: ") + e.what());
  }

  if (!row) {
    throw StoreError(StoreErrorKind::NOT_FOUND, "No job record for id " + id.str());
  }
  try {
    return decode_record(*row);
  } catch (const nlohmann::json::exception& e) {
    throw StoreError(StoreErrorKind::CORRUPT, "Malformed row for job " + id.str() + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw StoreError(StoreErrorKind::CORRUPT, "Malformed row for job " + id.str() + ": " + e.what());
  }
}

void SqliteJobStore::save_progress(const JobProgress& progress) {
  try {
    PooledConnection conn(*db_manager_);
    *conn << "INSERT INTO job_progress (job_id, progress_percent, status_message, updated_at) "
             "VALUES (?,?,?,?) "
             "ON CONFLICT(job_id) DO UPDATE SET progress_percent = excluded.progress_percent, "
             "status_message = excluded.status_message, updated_at = excluded.updated_at"
          << progress.job_id.str() << static_cast<double>(progress.progress_percent)
          << progress.status_message << time_point_to_string(progress.updated_at);
  } catch (const sqlite::sqlite_exception& e) {
    throw to_store_error("save_progress", e);
  } catch (const std::runtime_error& e) {
    throw StoreError(StoreErrorKind::IO_FAILURE, std::string("save_progress failed: ") + e.what());
  }
}

std::optional<JobProgress> SqliteJobStore::load_progress(const JobId& id) {
  std::optional<JobProgress> result;
  std::string updated_at_str;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT job_id, progress_percent, status_message, updated_at FROM job_progress "
             "WHERE job_id = ?"
          << id.str() >>
        [&](std::string job_id, double percent, std::string message, std::string updated_at) {
          JobProgress progress;
          progress.job_id = JobId(job_id);
          progress.progress_percent = static_cast<float>(percent);
          progress.status_message = message;
          updated_at_str = updated_at;
          result = std::move(progress);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw to_store_error("load_progress", e);
  } catch (const std::runtime_error& e) {
    throw StoreError(StoreErrorKind::IO_FAILURE, std::string("load_progress failed: ") + e.what());
  }

  if (result) {
    try {
      result->updated_at = string_to_time_point(updated_at_str);
    } catch (const std::invalid_argument& e) {
      throw StoreError(StoreErrorKind::CORRUPT,
                       "Malformed progress row for job " + id.str() + ": " + e.what());
    }
  }
  return result;
}

std::vector<JobRecord> SqliteJobStore::list_by_state(JobState state) {
  std::vector<RecordRow> rows;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT id, state, payload, abnormal, metadata, created_at, updated_at "
             "FROM job_records WHERE state = ? ORDER BY created_at ASC, id ASC"
          << to_string(state) >>
        [&](std::string row_id, std::string row_state, std::string payload, int abnormal,
            std::string metadata, std::string created_at, std::string updated_at) {
          rows.push_back(
              RecordRow{row_id, row_state, payload, abnormal, metadata, created_at, updated_at});
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw to_store_error("list_by_state", e);
  } catch (const std::runtime_error& e) {
    throw StoreError(StoreErrorKind::IO_FAILURE, std::string("list_by_state failed: ") + e.what());
  }

  std::vector<JobRecord> records;
  records.reserve(rows.size());
  for (const auto& row : rows) {
    try {
      records.push_back(decode_record(row));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "SqliteJobStore: skipping malformed row " << row.id << ": " << e.what()
                << std::endl;
    } catch (const std::invalid_argument& e) {
      std::cerr << "SqliteJobStore: skipping malformed row " << row.id << ": " << e.what()
                << std::endl;
    }
  }
  return records;
}

std::size_t SqliteJobStore::clear_terminal_records(int older_than_days) {
  if (older_than_days < 0) {
    throw std::invalid_argument("older_than_days must not be negative");
  }
  const auto now = std::chrono::system_clock::now();
  const std::chrono::hours age(static_cast<std::chrono::hours::rep>(older_than_days) * 24);
  // Compared in hours; converting age to the clock's ticks could overflow.
  if (age > std::chrono::duration_cast<std::chrono::hours>(now.time_since_epoch())) {
    throw std::invalid_argument("older_than_days " + std::to_string(older_than_days) +
                                " reaches before the epoch");
  }

  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    auto cutoff_time = now - age;
    std::string cutoff_str = time_point_to_string(cutoff_time);
    std::string succeeded_state = to_string(JobState::SUCCEEDED);
    std::string failed_state = to_string(JobState::FAILED);

    long long count = 0;
    *conn << "SELECT COUNT(*) FROM job_records WHERE state IN (?, ?) AND updated_at <= ?"
          << succeeded_state << failed_state << cutoff_str >>
        count;
    *conn << "DELETE FROM job_progress WHERE job_id IN (SELECT id FROM job_records "
             "WHERE state IN (?, ?) AND updated_at <= ?)"
          << succeeded_state << failed_state << cutoff_str;
    *conn << "DELETE FROM job_records WHERE state IN (?, ?) AND updated_at <= ?"
          << succeeded_state << failed_state << cutoff_str;
    tx.commit();
    return static_cast<std::size_t>(count);
  } catch (const sqlite::sqlite_exception& e) {
    throw to_store_error("clear_terminal_records", e);
  } catch (const std::runtime_error& e) {
    throw StoreError(StoreErrorKind::IO_FAILURE,
                     std::string("clear_terminal_records failed: ") + e.what());
  }
}

}  // namespace jobkeep_core
