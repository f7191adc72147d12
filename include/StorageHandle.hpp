#pragma once

/**
 * @file StorageHandle.hpp
 * @brief Asynchronous handle over one storage file with an explicit close lifecycle.
 */

#include "StorageBackend.hpp"
#include "OperationExecutor.hpp"
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace nativeio {

enum class HandleState {
    Open,
    Closing,
    Closed
};

enum class OperationKind {
    Read,
    Write,
    Flush,
    GetLength,
    SetLength
};

const char* handleStateName(HandleState state);
const char* operationKindName(OperationKind kind);

// The caller's buffer is handed back together with the transfer count
struct ReadResult {
    std::vector<uint8_t> buffer;
    uint64_t readBytes = 0;
};

struct WriteResult {
    std::vector<uint8_t> buffer;
    uint64_t writtenBytes = 0;
};

/**
 * @class StorageHandle
 * @brief Gatekeeper between callers and a StorageBackend.
 *
 * A handle starts Open and moves forward only: Open -> Closing -> Closed.
 * Every data operation is checked against the state and, if the handle is
 * Open, admitted into the pending set and run on the OperationExecutor.
 * The check and the admission happen under the same mutex that close()
 * takes to leave Open, so an operation is either admitted before close or
 * rejected after it.
 *
 * Rejected operations return a future that is already settled with
 * InvalidStateError when the call returns; the backend is never called.
 * Admitted operations settle with the backend's result (or its
 * StorageIoError) even if close() is requested while they run.
 *
 * The backend resource is released exactly once, after the last admitted
 * operation has finished. All close() calls share one completion.
 *
 * Handles are always owned by std::shared_ptr; queued operations hold a
 * reference so the handle stays alive until they settle.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 */
class StorageHandle : public std::enable_shared_from_this<StorageHandle> {
public:
    /**
     * @brief Create an Open handle.
     * @param name Storage name, used in log lines and error messages.
     * @param backend Collaborator owning the bytes; the handle takes ownership.
     * @param executor Pool the operations run on; must outlive the handle.
     */
    static std::shared_ptr<StorageHandle> create(std::string name,
                                                 std::unique_ptr<StorageBackend> backend,
                                                 OperationExecutor& executor);

    /**
     * @brief Releases the backend if the handle was never closed.
     */
    ~StorageHandle();

    // Non-copyable
    StorageHandle(const StorageHandle&) = delete;
    StorageHandle& operator=(const StorageHandle&) = delete;

    /**
     * @brief Read buffer.size() bytes starting at offset.
     *
     * Settles with the buffer and the number of bytes actually read, which
     * is smaller than requested near end of file.
     */
    std::future<ReadResult> read(std::vector<uint8_t> buffer, uint64_t offset);

    /**
     * @brief Write the whole buffer at offset, extending the file if needed.
     */
    std::future<WriteResult> write(std::vector<uint8_t> buffer, uint64_t offset);

    std::future<void> flush();
    std::future<uint64_t> getLength();
    std::future<void> setLength(uint64_t length);

    /**
     * @brief Close the handle.
     *
     * The first call leaves Open before returning, so no operation issued
     * afterwards is admitted. Release of the backend is deferred until the
     * operations already admitted have finished. Every call, concurrent or
     * later, returns the same completion; it never carries an exception.
     */
    std::shared_future<void> close();

    HandleState state() const;

    /**
     * @brief Number of admitted operations that have not finished yet.
     */
    size_t pendingCount() const;

    const std::string& name() const { return m_name; }

private:
    StorageHandle(std::string name,
                  std::unique_ptr<StorageBackend> backend,
                  OperationExecutor& executor);

    template<typename T, typename Fn>
    std::future<T> admit(OperationKind kind, Fn&& work);

    template<typename T, typename Fn>
    void runOperation(uint64_t id, OperationKind kind, std::promise<T>& promise, Fn& work);

    void finishOperation(uint64_t id);
    void scheduleRelease();
    void releaseResources();

    std::string m_name;
    std::unique_ptr<StorageBackend> m_backend;
    OperationExecutor& m_executor;

    HandleState m_state = HandleState::Open;
    std::unordered_map<uint64_t, OperationKind> m_pending;   ///< Admitted, not finished
    uint64_t m_nextOperationId = 1;
    bool m_releaseScheduled = false;

    std::promise<void> m_closePromise;
    std::shared_future<void> m_closed;

    mutable std::mutex m_mutex;     ///< Guards state, pending set and release flag
};

}  // namespace nativeio
