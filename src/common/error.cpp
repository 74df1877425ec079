// =============================================================================
// objfs - Error Handling Framework Implementation
// =============================================================================

#include "objfs/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace objfs {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!path.empty()) {
        oss << "path: " << path;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *byteOffset;
        hasContent = true;
    }

    if (partNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "part: " << *partNumber;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// ObjfsException Implementation
// =============================================================================

void ObjfsException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string StatusError::formatStatus(int status, const std::string& message) {
    return fmt::format("status {}: {}", status, message);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kNotFound:
            throw NotFoundError(message_);
        case ErrorCode::kPermissionDenied:
            throw PermissionDeniedError(message_);
        case ErrorCode::kAlreadyExists:
            throw AlreadyExistsError(message_);
        case ErrorCode::kUnsupportedOperation:
            throw UnsupportedOperationError(message_);
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kBackendError:
            throw BackendError(message_);
        case ErrorCode::kInvalidState:
            throw InvalidStateError(message_);
        case ErrorCode::kSuccess:
            break;
    }
    throw ObjfsException(code_, message_);
}

}  // namespace objfs
