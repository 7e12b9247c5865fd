#include "jobkeep_core/async/work_queue.hpp"

namespace jobkeep_core::async {

bool WorkQueue::push(WorkItem& item) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      return false;
    }
    items_.push_back(std::move(item));
  }
  cv_.notify_one();
  return true;
}

std::optional<WorkItem> WorkQueue::pop() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
  if (items_.empty()) {
    return std::nullopt;
  }
  WorkItem item = std::move(items_.front());
  items_.pop_front();
  return item;
}

std::optional<WorkItem> WorkQueue::try_pop() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (items_.empty()) {
    return std::nullopt;
  }
  WorkItem item = std::move(items_.front());
  items_.pop_front();
  return item;
}

void WorkQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool WorkQueue::is_closed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return closed_;
}

std::size_t WorkQueue::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return items_.size();
}

}  // namespace jobkeep_core::async
