#pragma once

/**
 * @file OperationExecutor.hpp
 * @brief Fixed-size worker pool that runs storage operations off the caller's thread.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace nativeio {

/**
 * @class OperationExecutor
 * @brief Runs queued tasks on a fixed set of worker threads.
 *
 * Tasks run in submission order per worker pick-up, but several tasks may
 * run at once when more than one worker is configured. The executor must
 * outlive every StorageHandle that submits work to it.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 */
class OperationExecutor {
public:
    using Task = std::function<void()>;

    /**
     * @brief Start the worker threads.
     * @param threadCount Number of workers; zero is treated as one.
     */
    explicit OperationExecutor(size_t threadCount = 4);

    /**
     * @brief Destructor - shuts down and joins the workers.
     */
    ~OperationExecutor();

    // Non-copyable
    OperationExecutor(const OperationExecutor&) = delete;
    OperationExecutor& operator=(const OperationExecutor&) = delete;

    /**
     * @brief Queue a task for execution.
     * @throws std::runtime_error if the executor has been shut down.
     */
    void submit(Task task);

    /**
     * @brief Stop accepting tasks, run the queued ones and join the workers.
     *
     * Safe to call more than once. Must not be called from a worker thread.
     */
    void shutdown();

    size_t threadCount() const { return m_workers.size(); }

    /**
     * @brief Number of tasks waiting for a worker.
     */
    size_t queuedCount() const;

    bool isShutdown() const { return m_shutdown.load(); }

private:
    void workerLoop(size_t index);

    std::vector<std::thread> m_workers;
    std::queue<Task> m_tasks;                 ///< Waiting tasks

    mutable std::mutex m_mutex;               ///< Protects m_tasks
    std::condition_variable m_cv;             ///< Signaled on new task or shutdown
    std::atomic<bool> m_shutdown{false};
    std::once_flag m_joinFlag;
};

}  // namespace nativeio
