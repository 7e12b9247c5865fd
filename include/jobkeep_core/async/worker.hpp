#pragma once

#include <functional>
#include <thread>

namespace jobkeep_core {
namespace async {

class WorkQueue;

/**
 * @class Worker
 * @brief One pool thread draining a shared WorkQueue.
 *
 * The loop blocks on the queue and exits once the queue is closed and empty.
 * An item that throws is logged; the worker moves on to the next one.
 * Owned by WorkerPool.
 */
class Worker {
public:
    /**
     * @param worker_id Shown in log lines as "Worker [id]".
     * @param queue Queue shared with the other workers of the pool. Must
     *        outlive the worker.
     */
    Worker(int worker_id, WorkQueue& queue);

    /**
     * @brief Joins the thread. Blocks until the queue is closed and drained.
     */
    ~Worker();

    /**
     * @brief Spawns the thread. Throws std::runtime_error if already started.
     */
    void start();

    // No-op if the thread was never started.
    void join();

    /**
     * @brief Runs the next queued item on the caller's thread.
     * @return false when nothing was queued.
     */
    bool run_one_task();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

private:
    void run_loop();
    void execute(const std::function<void()>& item);

    int m_worker_id;
    WorkQueue& m_queue;
    std::thread m_thread;
};

}  // namespace async
}  // namespace jobkeep_core
