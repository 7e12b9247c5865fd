#pragma once

#include <gmock/gmock.h>

#include <deque>
#include <mutex>
#include <stdexcept>

#include "jobkeep_core/async/id_generator.hpp"
#include "jobkeep_core/async/job_executor.hpp"
#include "jobkeep_core/store/job_store.hpp"
#include "jobkeep_core/store/memory_job_store.hpp"

namespace jobkeep_tests {

/**
 * Mock JobStore. By default every call is forwarded to an in-memory store, so
 * tests only override the calls they want to fail.
 */
class MockJobStore : public jobkeep_core::JobStore {
 public:
  MockJobStore() {
    using jobkeep_core::MemoryJobStore;
    ON_CALL(*this, save(testing::_))
        .WillByDefault(testing::Invoke(&real_, &MemoryJobStore::save));
    ON_CALL(*this, load(testing::_))
        .WillByDefault(testing::Invoke(&real_, &MemoryJobStore::load));
    ON_CALL(*this, save_progress(testing::_))
        .WillByDefault(testing::Invoke(&real_, &MemoryJobStore::save_progress));
    ON_CALL(*this, load_progress(testing::_))
        .WillByDefault(testing::Invoke(&real_, &MemoryJobStore::load_progress));
    ON_CALL(*this, list_by_state(testing::_))
        .WillByDefault(testing::Invoke(&real_, &MemoryJobStore::list_by_state));
  }

  MOCK_METHOD(void, save, (const jobkeep_core::JobRecord& record), (override));
  MOCK_METHOD(jobkeep_core::JobRecord, load, (const jobkeep_core::JobId& id), (override));
  MOCK_METHOD(void, save_progress, (const jobkeep_core::JobProgress& progress), (override));
  MOCK_METHOD(std::optional<jobkeep_core::JobProgress>, load_progress,
              (const jobkeep_core::JobId& id), (override));
  MOCK_METHOD(std::vector<jobkeep_core::JobRecord>, list_by_state,
              (jobkeep_core::JobState state), (override));

  // The backing store, for reading what actually got persisted
  jobkeep_core::MemoryJobStore& real() {
    return real_;
  }

 private:
  jobkeep_core::MemoryJobStore real_;
};

class MockJobIdGenerator : public jobkeep_core::JobIdGenerator {
 public:
  MOCK_METHOD(jobkeep_core::JobId, next, (), (override));
};

/**
 * Executor that only runs work when the test says so.
 */
class ManualExecutor : public jobkeep_core::async::JobExecutor {
 public:
  void post(jobkeep_core::async::WorkItem work) override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (rejecting_) {
      throw std::runtime_error("executor is shut down");
    }
    items_.push_back(std::move(work));
  }

  // Runs queued items on the calling thread, including ones they post
  size_t run_all() {
    size_t count = 0;
    while (true) {
      jobkeep_core::async::WorkItem item;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (items_.empty()) {
          return count;
        }
        item = std::move(items_.front());
        items_.pop_front();
      }
      item();
      ++count;
    }
  }

  // Destroys queued items without running them
  void discard_all() {
    std::deque<jobkeep_core::async::WorkItem> dropped;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      dropped.swap(items_);
    }
  }

  void set_rejecting(bool rejecting) {
    std::lock_guard<std::mutex> lock(mtx_);
    rejecting_ = rejecting;
  }

  size_t pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
  }

 private:
  mutable std::mutex mtx_;
  std::deque<jobkeep_core::async::WorkItem> items_;
  bool rejecting_ = false;
};

MATCHER_P(HasState, state, "") {
  return arg.status.state() == state;
}

}  // namespace jobkeep_tests
