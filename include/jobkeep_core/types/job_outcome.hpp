#pragma once

#include <stdexcept>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "jobkeep_core/types/job_record.hpp"

namespace jobkeep_core {

// What a task hands back: either its result value or its own error value.
// T and E may be the same type.
template <typename T, typename E>
class JobOutcome {
 public:
  using value_type = T;
  using error_type = E;

  static JobOutcome ok(T value) {
    return JobOutcome(std::in_place_index<0>, std::move(value));
  }
  static JobOutcome err(E error) {
    return JobOutcome(std::in_place_index<1>, std::move(error));
  }

  bool is_ok() const {
    return outcome_.index() == 0;
  }

  const T& value() const {
    if (!is_ok()) {
      throw std::logic_error("JobOutcome holds an error, not a value");
    }
    return std::get<0>(outcome_);
  }

  const E& error() const {
    if (is_ok()) {
      throw std::logic_error("JobOutcome holds a value, not an error");
    }
    return std::get<1>(outcome_);
  }

 private:
  template <std::size_t I, typename U>
  JobOutcome(std::in_place_index_t<I> index, U&& v) : outcome_(index, std::forward<U>(v)) {}

  std::variant<T, E> outcome_;
};

// Serializes the outcome into a terminal status. Throws nlohmann::json
// exceptions when T or E has no JSON conversion for the held value.
template <typename T, typename E>
JobStatus to_job_status(const JobOutcome<T, E>& outcome) {
  if (outcome.is_ok()) {
    return JobStatus::succeeded(nlohmann::json(outcome.value()));
  }
  return JobStatus::failed(nlohmann::json(outcome.error()));
}

}  // namespace jobkeep_core
