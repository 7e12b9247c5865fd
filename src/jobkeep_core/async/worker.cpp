#include "jobkeep_core/async/worker.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

#include "jobkeep_core/async/work_queue.hpp"

namespace jobkeep_core {
namespace async {

Worker::Worker(int worker_id, WorkQueue& queue) : m_worker_id(worker_id), m_queue(queue) {}

Worker::~Worker() {
  join();
}

void Worker::start() {
  if (m_thread.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  m_thread = std::thread(&Worker::run_loop, this);
}

void Worker::join() {
  if (m_thread.joinable()) {
    m_thread.join();
  }
}

void Worker::run_loop() {
  std::cout << "Worker [" << m_worker_id << "] starting run loop." << std::endl;
  while (std::optional<WorkItem> item = m_queue.pop()) {
    execute(*item);
  }
  std::cout << "Worker [" << m_worker_id << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  std::optional<WorkItem> item = m_queue.try_pop();
  if (!item) {
    return false;
  }
  execute(*item);
  return true;
}

void Worker::execute(const std::function<void()>& item) {
  try {
    item();
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << m_worker_id << "] ERROR in work item: " << e.what() << std::endl;
  } catch (...) {
    std::cerr << "Worker [" << m_worker_id << "] ERROR in work item: unknown exception" << std::endl;
  }
}

}  // namespace async
}  // namespace jobkeep_core
