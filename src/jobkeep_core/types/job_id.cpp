#include "jobkeep_core/types/job_id.hpp"

namespace jobkeep_core {

bool JobId::is_storage_safe() const {
  if (value_.empty() || value_.size() > 128) {
    return false;
  }
  for (char c : value_) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
              c == '_' || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

}  // namespace jobkeep_core
