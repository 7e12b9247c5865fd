#pragma once

#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "jobkeep_core/types/job_id.hpp"
#include "jobkeep_core/types/job_record.hpp"

namespace jobkeep_core {

enum class StoreErrorKind { NOT_FOUND, IO_FAILURE, CORRUPT };

inline std::string to_string(StoreErrorKind kind) {
  switch (kind) {
    case StoreErrorKind::NOT_FOUND: return "not_found";
    case StoreErrorKind::IO_FAILURE: return "io_failure";
    case StoreErrorKind::CORRUPT: return "corrupt";
  }
  return "unknown";
}

class StoreError : public std::exception {
 public:
  StoreError(StoreErrorKind kind, const std::string& message)
      : kind_(kind), message_(message) {}

  StoreErrorKind kind() const {
    return kind_;
  }
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  StoreErrorKind kind_;
  std::string message_;
};

/**
 * @class JobStore
 * @brief Persistence capability for job records.
 *
 * Implementations must make save() atomic per id: a concurrent load() sees
 * either the previous record or the new one, never a partial write. Calls for
 * different ids may run concurrently and must not interfere. No ordering or
 * transactional guarantee across ids is required.
 *
 * All operations report failures by throwing StoreError.
 */
class JobStore {
 public:
  virtual ~JobStore() = default;

  // Persists or overwrites the record for record.id.
  virtual void save(const JobRecord& record) = 0;

  // Most recently saved record for id. NOT_FOUND when there is none.
  virtual JobRecord load(const JobId& id) = 0;

  virtual void save_progress(const JobProgress& progress) = 0;
  virtual std::optional<JobProgress> load_progress(const JobId& id) = 0;

  virtual std::vector<JobRecord> list_by_state(JobState state) = 0;
};

}  // namespace jobkeep_core
