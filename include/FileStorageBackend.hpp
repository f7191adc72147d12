#pragma once

/**
 * @file FileStorageBackend.hpp
 * @brief StorageBackend over a POSIX file descriptor.
 */

#include "StorageBackend.hpp"
#include "ErrorHandler.hpp"
#include <filesystem>
#include <string>

namespace nativeio {

/**
 * @class FileStorageBackend
 * @brief Stores a handle's bytes in one regular file.
 *
 * The file is opened read/write (created if missing) in the constructor
 * and the descriptor is held until releaseResource(). Positional I/O
 * (pread/pwrite) is used throughout, so concurrent reads and writes on
 * different offsets do not disturb each other.
 *
 * Interrupted system calls are reissued via ErrorHandler::executeWithRetry
 * and short transfers are continued until the request is satisfied or end
 * of file is reached.
 *
 * Thread Safety:
 * - Data calls may run concurrently with each other
 * - releaseResource() must not run concurrently with any other call
 */
class FileStorageBackend : public StorageBackend {
public:
    /**
     * @brief Open (or create) the file at path.
     * @param path File to back the handle.
     * @param syncMetadata Use fsync on flush when true, fdatasync otherwise.
     * @throws StorageIoError if the file cannot be opened.
     */
    explicit FileStorageBackend(const std::filesystem::path& path, bool syncMetadata = true);

    /**
     * @brief Closes the descriptor if releaseResource() was never called.
     */
    ~FileStorageBackend() override;

    uint64_t readBytes(uint8_t* buffer, uint64_t length, uint64_t offset) override;
    uint64_t writeBytes(const uint8_t* buffer, uint64_t length, uint64_t offset) override;
    void flushBytes() override;
    uint64_t getByteLength() override;
    void setByteLength(uint64_t length) override;

    /**
     * @brief Close the descriptor.
     * @throws StorageIoError if close(2) reports a failure. The descriptor
     *         is gone either way.
     */
    void releaseResource() override;

    /**
     * @brief Whether the descriptor is still held.
     */
    bool isOpen() const { return m_fd >= 0; }

    const std::filesystem::path& path() const { return m_path; }

private:
    /**
     * @brief Throw StorageIoError(EBADF) if the descriptor was released.
     */
    void ensureOpen(const char* operation) const;

    /**
     * @brief Build a StorageIoError for errno and log it with the current ErrorContext.
     */
    StorageIoError failure(int error, const char* operation) const;

    std::filesystem::path m_path;     ///< Backing file
    bool m_syncMetadata;              ///< fsync vs fdatasync
    int m_fd = -1;                    ///< Open descriptor, -1 once released
};

}  // namespace nativeio
