#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>
#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "jobkeep_core/db/pooled_connection.hpp"
#include "jobkeep_core/db/sqlite_error_utils.hpp"

namespace jobkeep_core {

class DatabaseManagerTest : public jobkeep_tests::SqliteStoreTestBase {
 protected:
  void SetUp() override {
    jobkeep_tests::SqliteStoreTestBase::SetUp();
  }
};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  // Verify required tables exist
  std::vector<std::string> required_tables = {"job_records", "job_progress"};

  PooledConnection conn(*db_manager_);
  for (const auto& table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexes_Applied) {
  PooledConnection conn(*db_manager_);

  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name='idx_job_records_state_updated'" >> idx_count;
  EXPECT_EQ(idx_count, 1);
}

TEST_F(DatabaseManagerTest, InitializeTwice_IsNoOp) {
  auto original_path = db_manager_->db_path();
  auto other_path = jobkeep_tests::TestUtilities::create_temp_test_db();

  db_manager_->initialize(other_path, 2);
  EXPECT_EQ(db_manager_->db_path(), original_path);
  EXPECT_FALSE(std::filesystem::exists(other_path));
}

TEST_F(DatabaseManagerTest, ShutdownRejectsNewConnections) {
  db_manager_->shutdown();
  EXPECT_FALSE(db_manager_->is_initialized());
  try {
    PooledConnection conn(*db_manager_);
    FAIL() << "expected StoreError";
  } catch (const StoreError& e) {
    EXPECT_EQ(e.kind(), StoreErrorKind::IO_FAILURE);
  }
}

TEST_F(DatabaseManagerTest, CreatesParentDirectory) {
  auto dir = jobkeep_tests::TestUtilities::create_temp_test_dir();
  auto nested = dir / "nested" / "jobs.db";

  DatabaseManager mgr;
  mgr.initialize(nested, 1);
  EXPECT_TRUE(std::filesystem::exists(nested));
  mgr.shutdown();
  jobkeep_tests::TestUtilities::cleanup_temp_dir(dir);
}

TEST(SqliteErrorUtilsTest, ClassifiesPrimaryCodes) {
  EXPECT_EQ(sqlite_code_info(SQLITE_BUSY).store_kind, StoreErrorKind::IO_FAILURE);
  EXPECT_EQ(sqlite_code_info(SQLITE_LOCKED).store_kind, StoreErrorKind::IO_FAILURE);
  EXPECT_EQ(sqlite_code_info(SQLITE_FULL).store_kind, StoreErrorKind::IO_FAILURE);
  EXPECT_EQ(sqlite_code_info(SQLITE_CORRUPT).store_kind, StoreErrorKind::CORRUPT);
  EXPECT_EQ(sqlite_code_info(SQLITE_NOTADB).store_kind, StoreErrorKind::CORRUPT);
  EXPECT_STREQ(sqlite_code_info(SQLITE_CANTOPEN).name, "cantopen");
  EXPECT_STREQ(sqlite_code_info(12345).name, "generic");
}

TEST(SqliteErrorUtilsTest, NotADatabaseMapsToCorrupt) {
  auto path = jobkeep_tests::TestUtilities::write_temp_file(std::string(4096, 'x'), ".db");
  try {
    sqlite::database db(path.string());
    int count = 0;
    db << "SELECT COUNT(*) FROM sqlite_master" >> count;
    ADD_FAILURE() << "expected sqlite_exception";
  } catch (const sqlite::sqlite_exception& e) {
    StoreError error = to_store_error("schema_check", e);
    EXPECT_EQ(error.kind(), StoreErrorKind::CORRUPT);
    EXPECT_NE(std::string(error.what()).find("schema_check failed"), std::string::npos);
  }
  jobkeep_tests::TestUtilities::cleanup_temp_db(path);
}

}  // namespace jobkeep_core
