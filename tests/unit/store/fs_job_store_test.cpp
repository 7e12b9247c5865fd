#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "jobkeep_core/store/fs_job_store.hpp"
#include "utilities_test.hpp"

namespace jobkeep_tests {

using namespace jobkeep_core;

class FsJobStoreTest : public FsStoreTestBase {
 protected:
  void write_raw(const std::string& file_name, const std::string& contents) {
    std::ofstream file(temp_dir_ / file_name);
    file << contents;
  }

  StoreErrorKind load_error_kind(const std::string& id) {
    try {
      store_->load(JobId(id));
    } catch (const StoreError& e) {
      return e.kind();
    }
    ADD_FAILURE() << "expected StoreError for " << id;
    return StoreErrorKind::IO_FAILURE;
  }
};

TEST_F(FsJobStoreTest, ConstructorCreatesDirectory) {
  auto nested = temp_dir_ / "a" / "b";
  FsJobStore store(nested);
  EXPECT_TRUE(std::filesystem::is_directory(nested));
}

TEST_F(FsJobStoreTest, SaveAndLoadRecord) {
  JobRecord record = TestUtilities::create_test_record(
      "job-1", JobStatus::succeeded({{"rows", 3}}), {{"source", "import"}});
  store_->save(record);

  EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "job-1.json"));
  JobRecord loaded = store_->load(JobId("job-1"));
  EXPECT_EQ(loaded.status, record.status);
  EXPECT_EQ(loaded.metadata, record.metadata);
  EXPECT_EQ(loaded.created_at, record.created_at);
}

TEST_F(FsJobStoreTest, NoTempFilesLeftBehind) {
  JobRecord record = TestUtilities::create_test_record("job-1");
  store_->save(record);
  store_->save(record.with_status(JobStatus::running()));

  size_t entries = 0;
  for (const auto& entry : std::filesystem::directory_iterator(temp_dir_)) {
    EXPECT_NE(entry.path().filename().string()[0], '.') << entry.path();
    ++entries;
  }
  EXPECT_EQ(entries, 1u);
}

TEST_F(FsJobStoreTest, MissingFileIsNotFound) {
  EXPECT_EQ(load_error_kind("nobody"), StoreErrorKind::NOT_FOUND);
}

TEST_F(FsJobStoreTest, UnsafeIds) {
  EXPECT_EQ(load_error_kind("../escape"), StoreErrorKind::NOT_FOUND);
  try {
    store_->save(TestUtilities::create_test_record("../escape"));
    FAIL() << "expected StoreError";
  } catch (const StoreError& e) {
    EXPECT_EQ(e.kind(), StoreErrorKind::IO_FAILURE);
  }
  EXPECT_FALSE(std::filesystem::exists(temp_dir_.parent_path() / "escape.json"));
}

TEST_F(FsJobStoreTest, UnparseableFileIsCorrupt) {
  write_raw("broken.json", "{ not json");
  EXPECT_EQ(load_error_kind("broken"), StoreErrorKind::CORRUPT);

  write_raw("wrong-state.json",
            R"({"id":"wrong-state","state":"DONE","created_at":"2024-01-01 00:00:00","updated_at":"2024-01-01 00:00:00"})");
  EXPECT_EQ(load_error_kind("wrong-state"), StoreErrorKind::CORRUPT);
}

TEST_F(FsJobStoreTest, RecordForAnotherIdIsCorrupt) {
  nlohmann::json other = TestUtilities::create_test_record("other");
  write_raw("renamed.json", other.dump());
  EXPECT_EQ(load_error_kind("renamed"), StoreErrorKind::CORRUPT);
}

TEST_F(FsJobStoreTest, UnencodableRecordIsCorruptAndNotWritten) {
  try {
    store_->save(TestUtilities::create_test_record("bad-bytes", JobStatus::succeeded("\xff")));
    FAIL() << "expected StoreError";
  } catch (const StoreError& e) {
    EXPECT_EQ(e.kind(), StoreErrorKind::CORRUPT);
  }
  EXPECT_EQ(load_error_kind("bad-bytes"), StoreErrorKind::NOT_FOUND);

  JobProgress progress;
  progress.job_id = JobId("bad-bytes");
  progress.status_message = "bad \xc3";
  progress.updated_at = std::chrono::system_clock::now();
  EXPECT_THROW(store_->save_progress(progress), StoreError);
  EXPECT_FALSE(store_->load_progress(JobId("bad-bytes")).has_value());
}

TEST_F(FsJobStoreTest, SurvivesReopen) {
  store_->save(TestUtilities::create_test_record("job-1", JobStatus::failed("boom")));
  store_.reset();

  FsJobStore reopened(temp_dir_);
  EXPECT_EQ(reopened.load(JobId("job-1")).status.error<std::string>(), "boom");
}

TEST_F(FsJobStoreTest, ProgressRoundTrip) {
  EXPECT_FALSE(store_->load_progress(JobId("job-1")).has_value());

  JobProgress progress;
  progress.job_id = JobId("job-1");
  progress.progress_percent = 0.25f;
  progress.status_message = "reading";
  progress.updated_at = std::chrono::system_clock::now();
  store_->save_progress(progress);

  auto loaded = store_->load_progress(JobId("job-1"));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_FLOAT_EQ(loaded->progress_percent, 0.25f);
  EXPECT_EQ(loaded->status_message, "reading");

  // Progress files are not job records
  EXPECT_TRUE(store_->list_by_state(JobState::PENDING).empty());
}

TEST_F(FsJobStoreTest, ListByStateSkipsCorruptEntries) {
  store_->save(TestUtilities::create_test_record("b", JobStatus::running()));
  store_->save(TestUtilities::create_test_record("a", JobStatus::running()));
  store_->save(TestUtilities::create_test_record("c", JobStatus::succeeded(1)));
  write_raw("junk.json", "][");
  write_raw("notes.txt", "ignored");

  auto running = store_->list_by_state(JobState::RUNNING);
  ASSERT_EQ(running.size(), 2u);
  // Same creation second: ordered by id
  EXPECT_EQ(running[0].id, JobId("a"));
  EXPECT_EQ(running[1].id, JobId("b"));
}

TEST_F(FsJobStoreTest, ConcurrentWritersSameId) {
  JobRecord base = TestUtilities::create_test_record("shared");
  store_->save(base);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, &base, t]() {
      for (int i = 0; i < 50; ++i) {
        store_->save(base.with_status(JobStatus::succeeded(t * 100 + i)));
      }
    });
  }
  // Readers always see a complete document
  for (int i = 0; i < 100; ++i) {
    EXPECT_NO_THROW(store_->load(JobId("shared")));
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(store_->load(JobId("shared")).status.state(), JobState::SUCCEEDED);
}

}  // namespace jobkeep_tests
