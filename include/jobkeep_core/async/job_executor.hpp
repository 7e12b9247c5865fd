#pragma once

#include <functional>

namespace jobkeep_core::async {

using WorkItem = std::function<void()>;

// Concurrency substrate that runs submitted work detached from the caller.
// post() either takes ownership of the item or throws; an accepted item is
// eventually run or destroyed.
class JobExecutor {
 public:
  virtual ~JobExecutor() = default;
  virtual void post(WorkItem work) = 0;
};

}  // namespace jobkeep_core::async
