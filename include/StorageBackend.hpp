#pragma once

#include <cstddef>
#include <cstdint>

namespace nativeio {

// Byte-level storage behind a StorageHandle. Failures are reported by
// throwing StorageIoError. Implementations need not be safe against
// releaseResource() racing other calls; StorageHandle never does that.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Non-copyable, non-movable
    StorageBackend(const StorageBackend&) = delete;
    StorageBackend& operator=(const StorageBackend&) = delete;

    // Read up to length bytes at offset; returns the number of bytes read
    virtual uint64_t readBytes(uint8_t* buffer, uint64_t length, uint64_t offset) = 0;

    // Write length bytes at offset; returns the number of bytes written
    virtual uint64_t writeBytes(const uint8_t* buffer, uint64_t length, uint64_t offset) = 0;

    virtual void flushBytes() = 0;
    virtual uint64_t getByteLength() = 0;
    virtual void setByteLength(uint64_t length) = 0;

    // Release the underlying resource. Called at most once.
    virtual void releaseResource() = 0;

protected:
    StorageBackend() = default;
};

}  // namespace nativeio
