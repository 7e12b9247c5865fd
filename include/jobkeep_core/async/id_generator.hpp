#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

#include "jobkeep_core/types/job_id.hpp"

namespace jobkeep_core {

// Source of fresh job ids. next() may be called from many threads at once and
// must never hand out the same id twice within the process lifetime.
class JobIdGenerator {
 public:
  virtual ~JobIdGenerator() = default;
  virtual JobId next() = 0;
};

// Random (version 4) UUIDs in canonical 8-4-4-4-12 lowercase hex form.
class UuidJobIdGenerator : public JobIdGenerator {
 public:
  UuidJobIdGenerator();
  JobId next() override;

 private:
  std::mutex mtx_;
  std::mt19937_64 engine_;
};

// "<prefix>_<epoch micros>_<pid>_<counter>". Unique within a process by the
// counter, and across restarts by the timestamp and pid.
class SequentialJobIdGenerator : public JobIdGenerator {
 public:
  explicit SequentialJobIdGenerator(std::string prefix = "job");
  JobId next() override;

 private:
  std::string prefix_;
  std::atomic<uint64_t> counter_{0};
};

}  // namespace jobkeep_core
