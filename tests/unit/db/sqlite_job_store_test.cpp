#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "jobkeep_core/db/pooled_connection.hpp"
#include "jobkeep_core/db/sqlite_job_store.hpp"

namespace jobkeep_core {

class SqliteJobStoreTest : public jobkeep_tests::SqliteStoreTestBase {
 protected:
  StoreErrorKind load_error_kind(const std::string& id) {
    try {
      store_->load(JobId(id));
    } catch (const StoreError& e) {
      return e.kind();
    }
    ADD_FAILURE() << "expected StoreError for " << id;
    return StoreErrorKind::IO_FAILURE;
  }

  int count_rows(const std::string& table) {
    PooledConnection conn(*db_manager_);
    int count = 0;
    *conn << "SELECT COUNT(*) FROM " + table >> count;
    return count;
  }
};

using jobkeep_tests::TestUtilities;

TEST_F(SqliteJobStoreTest, ConstructorRequiresInitializedManager) {
  EXPECT_THROW(SqliteJobStore(nullptr), std::invalid_argument);
  EXPECT_THROW(SqliteJobStore(std::make_shared<DatabaseManager>()), std::invalid_argument);
}

TEST_F(SqliteJobStoreTest, SaveAndLoad_BasicFunctionality) {
  JobRecord record = TestUtilities::create_test_record(
      "job-1", JobStatus::succeeded({{"rows", 3}}), {{"source", "import"}});
  store_->save(record);

  JobRecord loaded = store_->load(JobId("job-1"));
  EXPECT_EQ(loaded.id, record.id);
  EXPECT_EQ(loaded.status, record.status);
  EXPECT_EQ(loaded.metadata, record.metadata);
  EXPECT_EQ(loaded.created_at, record.created_at);
  EXPECT_EQ(loaded.updated_at, record.updated_at);
}

TEST_F(SqliteJobStoreTest, Save_UpsertsSingleRow) {
  JobRecord record = TestUtilities::create_test_record("job-1");
  store_->save(record);
  store_->save(record.with_status(JobStatus::running()));
  store_->save(record.with_status(JobStatus::failed("boom")));

  EXPECT_EQ(count_rows("job_records"), 1);
  JobRecord loaded = store_->load(JobId("job-1"));
  EXPECT_EQ(loaded.status.error<std::string>(), "boom");
  EXPECT_FALSE(loaded.status.is_abnormal());
  EXPECT_EQ(loaded.created_at, record.created_at);
}

TEST_F(SqliteJobStoreTest, Load_AbnormalFailure) {
  store_->save(TestUtilities::create_test_record("job-1", JobStatus::abnormal("task threw: x")));

  JobRecord loaded = store_->load(JobId("job-1"));
  EXPECT_TRUE(loaded.status.is_abnormal());
  EXPECT_EQ(loaded.status.error<std::string>(), "task threw: x");
}

TEST_F(SqliteJobStoreTest, Load_UnknownIdIsNotFound) {
  EXPECT_EQ(load_error_kind("missing"), StoreErrorKind::NOT_FOUND);
}

TEST_F(SqliteJobStoreTest, Load_MalformedRowIsCorrupt) {
  {
    PooledConnection conn(*db_manager_);
    *conn << "INSERT INTO job_records (id, state, payload, abnormal, metadata, created_at, "
             "updated_at) VALUES ('bad-state', 'DONE', 'null', 0, 'null', "
             "'2024-01-01 00:00:00', '2024-01-01 00:00:00')";
    *conn << "INSERT INTO job_records (id, state, payload, abnormal, metadata, created_at, "
             "updated_at) VALUES ('bad-json', 'SUCCEEDED', '{oops', 0, 'null', "
             "'2024-01-01 00:00:00', '2024-01-01 00:00:00')";
  }
  EXPECT_EQ(load_error_kind("bad-state"), StoreErrorKind::CORRUPT);
  EXPECT_EQ(load_error_kind("bad-json"), StoreErrorKind::CORRUPT);
}

TEST_F(SqliteJobStoreTest, ShutDownManagerIsIoFailure) {
  db_manager_->shutdown();
  EXPECT_EQ(load_error_kind("job-1"), StoreErrorKind::IO_FAILURE);
  try {
    store_->save(TestUtilities::create_test_record("job-1"));
    FAIL() << "expected StoreError";
  } catch (const StoreError& e) {
    EXPECT_EQ(e.kind(), StoreErrorKind::IO_FAILURE);
  }
}

TEST_F(SqliteJobStoreTest, SurvivesReopen) {
  store_->save(TestUtilities::create_test_record("job-1", JobStatus::succeeded(42)));
  store_.reset();
  db_manager_->shutdown();

  auto reopened_manager = std::make_shared<DatabaseManager>();
  reopened_manager->initialize(temp_db_path_, 2);
  SqliteJobStore reopened(reopened_manager);
  EXPECT_EQ(reopened.load(JobId("job-1")).status.result<int>(), 42);
  reopened_manager->shutdown();
}

TEST_F(SqliteJobStoreTest, Progress_UpsertAndLoad) {
  EXPECT_FALSE(store_->load_progress(JobId("job-1")).has_value());

  JobProgress progress;
  progress.job_id = JobId("job-1");
  progress.progress_percent = 0.25f;
  progress.status_message = "reading";
  progress.updated_at = std::chrono::system_clock::now();
  store_->save_progress(progress);

  progress.progress_percent = 0.75f;
  progress.status_message = "writing";
  store_->save_progress(progress);

  EXPECT_EQ(count_rows("job_progress"), 1);
  auto loaded = store_->load_progress(JobId("job-1"));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_FLOAT_EQ(loaded->progress_percent, 0.75f);
  EXPECT_EQ(loaded->status_message, "writing");
}

TEST_F(SqliteJobStoreTest, ListByState_FiltersAndOrders) {
  store_->save(TestUtilities::create_test_record("newer", JobStatus::running(), nullptr,
                                                 std::chrono::hours(1)));
  store_->save(TestUtilities::create_test_record("older", JobStatus::running(), nullptr,
                                                 std::chrono::hours(2)));
  store_->save(TestUtilities::create_test_record("done", JobStatus::succeeded(1)));

  auto running = store_->list_by_state(JobState::RUNNING);
  ASSERT_EQ(running.size(), 2u);
  EXPECT_EQ(running[0].id, JobId("older"));
  EXPECT_EQ(running[1].id, JobId("newer"));
  EXPECT_TRUE(store_->list_by_state(JobState::PENDING).empty());
}

TEST_F(SqliteJobStoreTest, ClearTerminalRecords_RespectsAgeAndState) {
  store_->save(TestUtilities::create_test_record("old-done", JobStatus::succeeded(1), nullptr,
                                                 std::chrono::hours(24 * 10)));
  store_->save(TestUtilities::create_test_record("old-failed", JobStatus::failed("x"), nullptr,
                                                 std::chrono::hours(24 * 10)));
  store_->save(TestUtilities::create_test_record("old-running", JobStatus::running(), nullptr,
                                                 std::chrono::hours(24 * 10)));
  store_->save(TestUtilities::create_test_record("new-done", JobStatus::succeeded(2)));

  JobProgress progress;
  progress.job_id = JobId("old-done");
  progress.updated_at = std::chrono::system_clock::now();
  store_->save_progress(progress);

  EXPECT_EQ(store_->clear_terminal_records(7), 2u);

  EXPECT_EQ(load_error_kind("old-done"), StoreErrorKind::NOT_FOUND);
  EXPECT_EQ(load_error_kind("old-failed"), StoreErrorKind::NOT_FOUND);
  EXPECT_NO_THROW(store_->load(JobId("old-running")));
  EXPECT_NO_THROW(store_->load(JobId("new-done")));
  EXPECT_FALSE(store_->load_progress(JobId("old-done")).has_value());
}

TEST_F(SqliteJobStoreTest, ClearTerminalRecords_RejectsOutOfRangeAge) {
  store_->save(TestUtilities::create_test_record("old-done", JobStatus::succeeded(1), nullptr,
                                                 std::chrono::hours(24 * 10)));

  EXPECT_THROW(store_->clear_terminal_records(100000000), std::invalid_argument);
  EXPECT_THROW(store_->clear_terminal_records(std::numeric_limits<int>::max()),
               std::invalid_argument);
  EXPECT_THROW(store_->clear_terminal_records(-1), std::invalid_argument);
  EXPECT_NO_THROW(store_->load(JobId("old-done")));

  // About 27 years still lies after the epoch
  EXPECT_EQ(store_->clear_terminal_records(10000), 0u);
  EXPECT_NO_THROW(store_->load(JobId("old-done")));
}

TEST_F(SqliteJobStoreTest, ConcurrentSaves_DifferentIds) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, t]() {
      for (int i = 0; i < 25; ++i) {
        std::string id = "job-" + std::to_string(t) + "-" + std::to_string(i);
        JobRecord record = TestUtilities::create_test_record(id);
        store_->save(record);
        store_->save(record.with_status(JobStatus::succeeded(i)));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(store_->list_by_state(JobState::SUCCEEDED).size(), 100u);
}

}  // namespace jobkeep_core
