#include "StorageHandle.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace nativeio {

const char* handleStateName(HandleState state) {
    switch (state) {
        case HandleState::Open:
            return "open";
        case HandleState::Closing:
            return "closing";
        case HandleState::Closed:
            return "closed";
    }
    return "unknown";
}

const char* operationKindName(OperationKind kind) {
    switch (kind) {
        case OperationKind::Read:
            return "read";
        case OperationKind::Write:
            return "write";
        case OperationKind::Flush:
            return "flush";
        case OperationKind::GetLength:
            return "getLength";
        case OperationKind::SetLength:
            return "setLength";
    }
    return "unknown";
}

std::shared_ptr<StorageHandle> StorageHandle::create(std::string name,
                                                     std::unique_ptr<StorageBackend> backend,
                                                     OperationExecutor& executor) {
    if (!backend) {
        throw std::invalid_argument("StorageHandle requires a backend");
    }
    return std::shared_ptr<StorageHandle>(
        new StorageHandle(std::move(name), std::move(backend), executor));
}

StorageHandle::StorageHandle(std::string name,
                             std::unique_ptr<StorageBackend> backend,
                             OperationExecutor& executor)
    : m_name(std::move(name))
    , m_backend(std::move(backend))
    , m_executor(executor)
    , m_closed(m_closePromise.get_future().share()) {
}

StorageHandle::~StorageHandle() {
    // Last reference gone, so nothing can be pending
    if (m_state == HandleState::Open) {
        spdlog::debug("{}: dropped without close, releasing", m_name);
        try {
            m_backend->releaseResource();
        } catch (const std::exception& e) {
            spdlog::warn("{}: releasing storage failed: {}", m_name, e.what());
        } catch (...) {
            spdlog::warn("{}: releasing storage failed with an unknown error", m_name);
        }
    }
}

template<typename T, typename Fn>
std::future<T> StorageHandle::admit(OperationKind kind, Fn&& work) {
    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> future = promise->get_future();
    uint64_t id = 0;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_state != HandleState::Open) {
            spdlog::debug("{}: {} rejected, handle is {}", m_name,
                          operationKindName(kind), handleStateName(m_state));
            promise->set_exception(std::make_exception_ptr(InvalidStateError(
                std::string(operationKindName(kind)) + " on " + m_name +
                ": the file is closed")));
            return future;
        }

        id = m_nextOperationId++;
        m_pending.emplace(id, kind);
    }

    spdlog::debug("{}: {} admitted as operation {}", m_name, operationKindName(kind), id);

    auto self = shared_from_this();
    try {
        m_executor.submit([self, id, kind, promise, work = std::forward<Fn>(work)]() mutable {
            self->runOperation<T>(id, kind, *promise, work);
        });
    } catch (const std::runtime_error& e) {
        spdlog::error("{}: could not schedule {}: {}", m_name, operationKindName(kind), e.what());
        promise->set_exception(std::make_exception_ptr(
            StorageIoError(ECANCELED, std::string(operationKindName(kind)) + " " + m_name)));
        finishOperation(id);
    } catch (...) {
        // Not queued, so the operation must leave the pending set here
        spdlog::error("{}: could not schedule {}", m_name, operationKindName(kind));
        promise->set_exception(std::current_exception());
        finishOperation(id);
    }

    return future;
}

template<typename T, typename Fn>
void StorageHandle::runOperation(uint64_t id, OperationKind kind, std::promise<T>& promise, Fn& work) {
    {
        ErrorContext context(m_name + " " + operationKindName(kind));
        try {
            if constexpr (std::is_void_v<T>) {
                work(*m_backend);
                promise.set_value();
            } else {
                promise.set_value(work(*m_backend));
            }
        } catch (...) {
            // Backend failures reach the caller unchanged
            promise.set_exception(std::current_exception());
        }
    }

    finishOperation(id);
}

std::future<ReadResult> StorageHandle::read(std::vector<uint8_t> buffer, uint64_t offset) {
    return admit<ReadResult>(OperationKind::Read,
        [buffer = std::move(buffer), offset](StorageBackend& backend) mutable {
            ReadResult result;
            result.readBytes = backend.readBytes(buffer.data(), buffer.size(), offset);
            result.buffer = std::move(buffer);
            return result;
        });
}

std::future<WriteResult> StorageHandle::write(std::vector<uint8_t> buffer, uint64_t offset) {
    return admit<WriteResult>(OperationKind::Write,
        [buffer = std::move(buffer), offset](StorageBackend& backend) mutable {
            WriteResult result;
            result.writtenBytes = backend.writeBytes(buffer.data(), buffer.size(), offset);
            result.buffer = std::move(buffer);
            return result;
        });
}

std::future<void> StorageHandle::flush() {
    return admit<void>(OperationKind::Flush, [](StorageBackend& backend) {
        backend.flushBytes();
    });
}

std::future<uint64_t> StorageHandle::getLength() {
    return admit<uint64_t>(OperationKind::GetLength, [](StorageBackend& backend) {
        return backend.getByteLength();
    });
}

std::future<void> StorageHandle::setLength(uint64_t length) {
    return admit<void>(OperationKind::SetLength, [length](StorageBackend& backend) {
        backend.setByteLength(length);
    });
}

std::shared_future<void> StorageHandle::close() {
    bool releaseNow = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_state != HandleState::Open) {
            spdlog::debug("{}: close requested while {}", m_name, handleStateName(m_state));
            return m_closed;
        }

        m_state = HandleState::Closing;
        spdlog::debug("{}: closing with {} pending operations", m_name, m_pending.size());

        if (m_pending.empty()) {
            m_releaseScheduled = true;
            releaseNow = true;
        }
    }

    if (releaseNow) {
        scheduleRelease();
    }

    return m_closed;
}

HandleState StorageHandle::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

size_t StorageHandle::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

void StorageHandle::finishOperation(uint64_t id) {
    bool releaseNow = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.erase(id);

        if (m_state == HandleState::Closing && m_pending.empty() && !m_releaseScheduled) {
            m_releaseScheduled = true;
            releaseNow = true;
        }
    }

    // Already on a worker; the last admitted operation performs the release
    if (releaseNow) {
        releaseResources();
    }
}

void StorageHandle::scheduleRelease() {
    auto self = shared_from_this();
    try {
        m_executor.submit([self]() { self->releaseResources(); });
    } catch (const std::runtime_error& e) {
        spdlog::warn("{}: executor unavailable ({}), releasing inline", m_name, e.what());
        releaseResources();
    }
}

void StorageHandle::releaseResources() {
    try {
        m_backend->releaseResource();
    } catch (const std::exception& e) {
        spdlog::warn("{}: releasing storage failed: {}", m_name, e.what());
    } catch (...) {
        spdlog::warn("{}: releasing storage failed with an unknown error", m_name);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = HandleState::Closed;
    }

    spdlog::info("{}: closed", m_name);
    m_closePromise.set_value();
}

}  // namespace nativeio
