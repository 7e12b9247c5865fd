#include "jobkeep_core/db/database_manager.hpp"

#include <iostream>
#include <stdexcept>

namespace jobkeep_core {

namespace {

constexpr const char* kCreateJobRecords = R"(
    CREATE TABLE IF NOT EXISTS job_records (
        id TEXT PRIMARY KEY,
        state TEXT NOT NULL,
        payload TEXT NOT NULL DEFAULT 'null',
        abnormal INTEGER NOT NULL DEFAULT 0,
        metadata TEXT NOT NULL DEFAULT 'null',
        created_at TEXT NOT NULL,
        updated_at TEXT NOT NULL
    )
)";

// Latest report only; each report replaces the row
constexpr const char* kCreateJobProgress = R"(
    CREATE TABLE IF NOT EXISTS job_progress (
        job_id TEXT PRIMARY KEY,
        progress_percent REAL NOT NULL DEFAULT 0.0,
        status_message TEXT NOT NULL DEFAULT '',
        updated_at TEXT NOT NULL
    )
)";

// Serves list_by_state and the retention sweep
constexpr const char* kCreateStateIndex = R"(
    CREATE INDEX IF NOT EXISTS idx_job_records_state_updated
    ON job_records(state, updated_at)
)";

}  // namespace

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    std::cerr << "DatabaseManager: already open on " << db_path_ << ", ignoring " << db_path
              << std::endl;
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }
  setup_schema(db_path);
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);

  db_path_ = db_path;
  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  is_initialized_ = false;
  pool_->shutdown();
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("Database " + db_path_.string() + " is not open.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (pool_) {
    pool_->return_connection(std::move(conn));
  }
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  // Schema is created on a throwaway connection before the pool opens its own
  sqlite::database db(db_path.string());
  db << "PRAGMA journal_mode = WAL;";
  db << kCreateJobRecords;
  db << kCreateJobProgress;
  db << kCreateStateIndex;
}

}  // namespace jobkeep_core
