#pragma once

#include <exception>
#include <string>

#include "jobkeep_core/types/job_id.hpp"

namespace jobkeep_core {

enum class SubmitErrorKind { PERSISTENCE_ERROR, ID_GENERATION_ERROR };

// Thrown by JobRunner::submit. No work has been scheduled when this is thrown.
class SubmitError : public std::exception {
 public:
  SubmitError(SubmitErrorKind kind, const std::string& message) : kind_(kind), message_(message) {}

  SubmitErrorKind kind() const {
    return kind_;
  }
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  SubmitErrorKind kind_;
  std::string message_;
};

enum class LoadErrorKind { UNKNOWN_JOB, BACKEND_ERROR };

// UNKNOWN_JOB: no record was ever saved for the id.
// BACKEND_ERROR: the store failed to read (I/O failure or corrupt data).
class LoadError : public std::exception {
 public:
  LoadError(LoadErrorKind kind, const JobId& id, const std::string& message)
      : kind_(kind), id_(id), message_(message) {}

  LoadErrorKind kind() const {
    return kind_;
  }
  const JobId& id() const {
    return id_;
  }
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  LoadErrorKind kind_;
  JobId id_;
  std::string message_;
};

}  // namespace jobkeep_core
