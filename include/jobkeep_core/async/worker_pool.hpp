#pragma once

#include "jobkeep_core/async/job_executor.hpp"
#include "jobkeep_core/async/work_queue.hpp"
#include "jobkeep_core/async/worker.hpp"
#include <memory>
#include <mutex>
#include <vector>

namespace jobkeep_core::async {

/**
 * @class WorkerPool
 * @brief Fixed set of Worker threads behind one WorkQueue; the JobExecutor
 * that JobRunner posts jobs to.
 *
 * Lifecycle is start(), post()..., stop(). stop() runs everything already
 * queued before returning, and the destructor calls it.
 */
class WorkerPool : public JobExecutor {
public:
    // Creates the workers without starting them. Throws std::invalid_argument for 0.
    explicit WorkerPool(size_t num_threads);

    ~WorkerPool() override;

    /**
     * @brief Starts every worker thread. A second call only warns.
     * @throws std::runtime_error once the pool has been stopped.
     */
    void start();

    /**
     * @brief Queues work for the next free worker.
     *
     * Work may be queued before start(). Throws std::runtime_error once the
     * pool has been stopped.
     */
    void post(WorkItem work) override;

    /**
     * @brief Closes the queue and blocks until every queued item has run.
     *
     * If the pool was never started, the items run on the calling thread.
     * A stopped pool cannot be restarted.
     */
    void stop();

    bool is_running() const;
    size_t size() const { return m_workers.size(); }
    size_t pending() const { return m_queue.size(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

private:
    WorkQueue m_queue;
    std::vector<std::unique_ptr<Worker>> m_workers;
    mutable std::mutex m_state_mutex;
    bool m_is_running = false;
    bool m_is_stopped = false;
};

} // namespace jobkeep_core::async
