#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "jobkeep_core/async/job_executor.hpp"

namespace jobkeep_core::async {

// FIFO of work items shared by the workers of one pool.
class WorkQueue {
 public:
  // Returns false if the queue is closed; the item is then left untouched.
  bool push(WorkItem& item);

  // Blocks until an item is available. nullopt once closed and drained.
  std::optional<WorkItem> pop();

  std::optional<WorkItem> try_pop();

  // Wakes every waiter. Queued items stay available to pop().
  void close();

  bool is_closed() const;
  std::size_t size() const;

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<WorkItem> items_;
  bool closed_ = false;
};

}  // namespace jobkeep_core::async
