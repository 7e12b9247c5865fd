#include "jobkeep_core/async/worker_pool.hpp"
#include <iostream>
#include <stdexcept>

namespace jobkeep_core::async {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        throw std::invalid_argument("WorkerPool must have at least one thread.");
    }

    m_workers.reserve(num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        m_workers.emplace_back(std::make_unique<Worker>(static_cast<int>(i), m_queue));
    }
    std::cout << "WorkerPool: created " << num_threads << " worker(s)." << std::endl;
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (m_is_stopped) {
        throw std::runtime_error("WorkerPool has been stopped and cannot be restarted.");
    }
    if (m_is_running) {
        std::cerr << "WorkerPool: WARNING start() called on a running pool." << std::endl;
        return;
    }
    std::cout << "WorkerPool: starting " << m_workers.size() << " worker(s)." << std::endl;
    for (const auto& worker : m_workers) {
        worker->start();
    }
    m_is_running = true;
}

void WorkerPool::post(WorkItem work) {
    if (!m_queue.push(work)) {
        throw std::runtime_error("WorkerPool has been stopped; work rejected.");
    }
}

void WorkerPool::stop() {
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (m_is_stopped) {
            return;
        }
        m_is_stopped = true;
        was_running = m_is_running;
        m_is_running = false;
    }

    std::cout << "WorkerPool: stopping, " << m_queue.size() << " item(s) still queued." << std::endl;
    m_queue.close();
    if (was_running) {
        for (const auto& worker : m_workers) {
            worker->join();
        }
    } else {
        // Never started: drain on the caller so accepted work is not lost
        while (m_workers.front()->run_one_task()) {
        }
    }
}

bool WorkerPool::is_running() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_is_running;
}

} // namespace jobkeep_core::async
