#pragma once

#include <functional>
#include <ostream>
#include <string>

namespace jobkeep_core {

// Opaque job identifier. Backends use the raw value as a file name or row key,
// so only storage-safe ids are ever persisted.
class JobId {
 public:
  JobId() = default;
  explicit JobId(std::string value) : value_(std::move(value)) {}

  const std::string& str() const {
    return value_;
  }
  bool empty() const {
    return value_.empty();
  }

  // 1..128 characters of [A-Za-z0-9_-]
  bool is_storage_safe() const;

  bool operator==(const JobId& other) const {
    return value_ == other.value_;
  }
  bool operator!=(const JobId& other) const {
    return value_ != other.value_;
  }
  bool operator<(const JobId& other) const {
    return value_ < other.value_;
  }

 private:
  std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const JobId& id) {
  return os << id.str();
}

}  // namespace jobkeep_core

namespace std {
template <>
struct hash<jobkeep_core::JobId> {
  size_t operator()(const jobkeep_core::JobId& id) const noexcept {
    return hash<string>()(id.str());
  }
};
}  // namespace std
