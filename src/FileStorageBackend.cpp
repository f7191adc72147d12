#include "FileStorageBackend.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <limits>

namespace nativeio {

namespace {

constexpr uint64_t kMaxOffset = static_cast<uint64_t>(std::numeric_limits<off_t>::max());

bool fitsOffset(uint64_t offset, uint64_t length) {
    return offset <= kMaxOffset && length <= kMaxOffset - offset;
}

}  // namespace

FileStorageBackend::FileStorageBackend(const std::filesystem::path& path, bool syncMetadata)
    : m_path(path), m_syncMetadata(syncMetadata) {
    ssize_t fd = ErrorHandler::executeWithRetry([&]() -> ssize_t {
        int result = ::open(m_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        return result < 0 ? -errno : result;
    });

    if (fd < 0) {
        throw failure(static_cast<int>(-fd), "open");
    }

    m_fd = static_cast<int>(fd);
    spdlog::debug("Opened {} (fd {})", m_path.string(), m_fd);
}

FileStorageBackend::~FileStorageBackend() {
    if (m_fd >= 0) {
        ::close(m_fd);
        spdlog::debug("Closed {} on destruction", m_path.string());
    }
}

uint64_t FileStorageBackend::readBytes(uint8_t* buffer, uint64_t length, uint64_t offset) {
    ensureOpen("read");

    if (!fitsOffset(offset, length)) {
        throw failure(EINVAL, "read");
    }

    uint64_t total = 0;
    while (total < length) {
        ssize_t n = ErrorHandler::executeWithRetry([&]() -> ssize_t {
            ssize_t result = ::pread(m_fd, buffer + total, length - total,
                                     static_cast<off_t>(offset + total));
            return result < 0 ? -errno : result;
        });

        if (n < 0) {
            throw failure(static_cast<int>(-n), "read");
        }
        if (n == 0) {
            break;  // end of file
        }
        total += static_cast<uint64_t>(n);
    }

    return total;
}

uint64_t FileStorageBackend::writeBytes(const uint8_t* buffer, uint64_t length, uint64_t offset) {
    ensureOpen("write");

    if (!fitsOffset(offset, length)) {
        throw failure(EINVAL, "write");
    }

    uint64_t total = 0;
    while (total < length) {
        ssize_t n = ErrorHandler::executeWithRetry([&]() -> ssize_t {
            ssize_t result = ::pwrite(m_fd, buffer + total, length - total,
                                      static_cast<off_t>(offset + total));
            return result < 0 ? -errno : result;
        });

        if (n < 0) {
            throw failure(static_cast<int>(-n), "write");
        }
        if (n == 0) {
            throw failure(EIO, "write");
        }
        total += static_cast<uint64_t>(n);
    }

    return total;
}

void FileStorageBackend::flushBytes() {
    ensureOpen("flush");

    ssize_t result = ErrorHandler::executeWithRetry([&]() -> ssize_t {
        int rc = m_syncMetadata ? ::fsync(m_fd) : ::fdatasync(m_fd);
        return rc < 0 ? -errno : 0;
    });

    if (result < 0) {
        throw failure(static_cast<int>(-result), "flush");
    }
}

uint64_t FileStorageBackend::getByteLength() {
    ensureOpen("getLength");

    struct stat st {};
    if (::fstat(m_fd, &st) < 0) {
        throw failure(errno, "getLength");
    }

    return static_cast<uint64_t>(st.st_size);
}

void FileStorageBackend::setByteLength(uint64_t length) {
    ensureOpen("setLength");

    if (length > kMaxOffset) {
        throw failure(EINVAL, "setLength");
    }

    ssize_t result = ErrorHandler::executeWithRetry([&]() -> ssize_t {
        int rc = ::ftruncate(m_fd, static_cast<off_t>(length));
        return rc < 0 ? -errno : 0;
    });

    if (result < 0) {
        throw failure(static_cast<int>(-result), "setLength");
    }
}

void FileStorageBackend::releaseResource() {
    ensureOpen("close");

    int fd = m_fd;
    m_fd = -1;

    // close(2) must not be retried on EINTR; the descriptor is already gone
    if (::close(fd) < 0) {
        throw failure(errno, "close");
    }

    spdlog::debug("Released {} (fd {})", m_path.string(), fd);
}

void FileStorageBackend::ensureOpen(const char* operation) const {
    if (m_fd < 0) {
        throw failure(EBADF, operation);
    }
}

StorageIoError FileStorageBackend::failure(int error, const char* operation) const {
    std::string context = ErrorContext::current();
    spdlog::debug("{} failed on {}{}{}: {}", operation, m_path.string(),
                  context.empty() ? "" : " during ", context,
                  ErrorHandler::getErrorMessage(error));
    return StorageIoError(error, std::string(operation) + " " + m_path.filename().string());
}

}  // namespace nativeio
