#include "OperationExecutor.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace nativeio {

OperationExecutor::OperationExecutor(size_t threadCount) {
    if (threadCount == 0) {
        threadCount = 1;
    }

    m_workers.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        m_workers.emplace_back(&OperationExecutor::workerLoop, this, i);
    }

    spdlog::info("Operation executor started with {} worker threads", threadCount);
}

OperationExecutor::~OperationExecutor() {
    shutdown();
}

void OperationExecutor::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            throw std::runtime_error("Operation executor is shut down");
        }
        m_tasks.push(std::move(task));
    }
    m_cv.notify_one();
}

void OperationExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    m_cv.notify_all();

    std::call_once(m_joinFlag, [this]() {
        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        spdlog::info("Operation executor stopped");
    });
}

size_t OperationExecutor::queuedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void OperationExecutor::workerLoop(size_t index) {
    spdlog::debug("Worker {} started", index);

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_shutdown || !m_tasks.empty(); });

            // Drain the queue before honouring shutdown
            if (m_tasks.empty()) {
                break;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker {}: task failed: {}", index, e.what());
        } catch (...) {
            spdlog::error("Worker {}: task failed with an unknown error", index);
        }
    }

    spdlog::debug("Worker {} stopped", index);
}

}  // namespace nativeio
