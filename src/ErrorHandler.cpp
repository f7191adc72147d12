#include "ErrorHandler.hpp"
#include <cerrno>
#include <cstring>

namespace nativeio {

thread_local std::string ErrorContext::s_currentContext;

ErrorKind ErrorHandler::errnoToKind(int error) {
    switch (error) {
        // Success
        case 0:
            return ErrorKind::None;

        // Not found errors
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::NotFound;

        // Permission and busy errors
        case EACCES:
        case EPERM:
        case EROFS:
        case EBUSY:
        case ETXTBSY:
            return ErrorKind::NoModificationAllowed;

        // Disk/space errors
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return ErrorKind::QuotaExceeded;

        // Invalid input errors
        case EINVAL:
        case EOVERFLOW:
        case ENAMETOOLONG:
            return ErrorKind::InvalidArgument;

        // Default to I/O error
        default:
            return ErrorKind::Io;
    }
}

std::string ErrorHandler::kindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::InvalidState:
            return "InvalidStateError";
        case ErrorKind::InvalidName:
            return "InvalidCharacterError";
        case ErrorKind::NoModificationAllowed:
            return "NoModificationAllowedError";
        case ErrorKind::NotFound:
            return "NotFoundError";
        case ErrorKind::QuotaExceeded:
            return "QuotaExceededError";
        case ErrorKind::InvalidArgument:
            return "TypeError";
        case ErrorKind::Io:
            return "UnknownError";
    }
    return "UnknownError";
}

bool ErrorHandler::isRetryable(int error) {
    switch (error) {
        case EINTR:
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
            return true;
        default:
            return false;
    }
}

std::string ErrorHandler::getErrorMessage(int error) {
    switch (error) {
        case 0:
            return "Success";
        case ENOENT:
            return "File does not exist";
        case EACCES:
            return "Access denied";
        case EBADF:
            return "File descriptor is not open";
        case ENOSPC:
            return "No space left on device";
        case EFBIG:
            return "File too large";
        case EINVAL:
            return "Invalid argument";
        case EIO:
            return "Input/output error";
        default:
            return std::strerror(error);
    }
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

NativeIOException::NativeIOException(ErrorKind kind, const std::string& message, int posixError)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_posixError(posixError) {
}

InvalidStateError::InvalidStateError(const std::string& message)
    : NativeIOException(ErrorKind::InvalidState, message) {
}

StorageIoError::StorageIoError(int posixError, const std::string& message)
    : NativeIOException(ErrorHandler::errnoToKind(posixError),
                        message + ": " + ErrorHandler::getErrorMessage(posixError),
                        posixError) {
}

}  // namespace nativeio
