#pragma once

#include <string>
#include <functional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <chrono>
#include <cerrno>
#include <sys/types.h>

namespace nativeio {

// Failure kinds reported to callers. InvalidState is produced only by the
// handle lifecycle; the rest come from the storage and naming layers.
enum class ErrorKind {
    None,
    InvalidState,
    InvalidName,
    NoModificationAllowed,
    NotFound,
    QuotaExceeded,
    InvalidArgument,
    Io
};

// POSIX errno classification and helpers
class ErrorHandler {
public:
    // Convert errno to error kind
    static ErrorKind errnoToKind(int error);

    // DOM-style name for an error kind ("InvalidStateError", ...)
    static std::string kindName(ErrorKind kind);

    // Check if the failed system call should simply be reissued
    static bool isRetryable(int error);

    // Get human-readable error message
    static std::string getErrorMessage(int error);

    // Execute with retry logic. The operation returns a non-negative result
    // on success or -errno on failure.
    template<typename Func>
    static ssize_t executeWithRetry(Func&& operation, int maxRetries = 3) {
        int retries = 0;
        ssize_t result = 0;

        while (retries < maxRetries) {
            result = operation();
            if (result >= 0) {
                return result;
            }

            if (!isRetryable(static_cast<int>(-result))) {
                return result;
            }

            retries++;
            if (retries < maxRetries) {
                // Exponential backoff: 2ms, 4ms, 8ms...
                std::this_thread::sleep_for(
                    std::chrono::milliseconds(1 << retries));
            }
        }

        return result;
    }
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Base of every error this library throws
class NativeIOException : public std::runtime_error {
public:
    NativeIOException(ErrorKind kind, const std::string& message, int posixError = 0);

    ErrorKind kind() const { return m_kind; }
    int posixError() const { return m_posixError; }
    std::string name() const { return ErrorHandler::kindName(m_kind); }

private:
    ErrorKind m_kind;
    int m_posixError;
};

// Operation issued against a handle that is closing or closed
class InvalidStateError : public NativeIOException {
public:
    explicit InvalidStateError(const std::string& message);
};

// Failure reported by the storage backend for an admitted operation
class StorageIoError : public NativeIOException {
public:
    StorageIoError(int posixError, const std::string& message);
};

}  // namespace nativeio
