// =============================================================================
// objfs - Error Handling Framework
// =============================================================================
// Error taxonomy shared by every layer of the objfs library.
//
// This module provides:
// - ErrorCode enum doubling as CLI exit codes
// - ObjfsException hierarchy thrown by stream and storage operations
// - Result<T, E> type for validation helpers (using std::expected)
// - Error context (path, byte offset, part number)
//
// Backend failures are normalized into NotFound / PermissionDenied /
// AlreadyExists at the storage boundary (see storage/error_mapping.h);
// everything else surfaces as BackendError or propagates unchanged.
// =============================================================================

#ifndef OBJFS_COMMON_ERROR_H
#define OBJFS_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace objfs {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error on the command line.
    kUsageError = 1,

    /// @brief Local I/O error not covered by a more specific code.
    kIOError = 2,

    /// @brief Object, file or mount point does not exist.
    kNotFound = 3,

    /// @brief Access to the object was refused by the store.
    kPermissionDenied = 4,

    /// @brief Object already exists (exclusive creation).
    kAlreadyExists = 5,

    /// @brief Operation not supported in the stream's mode or by the backend.
    kUnsupportedOperation = 6,

    /// @brief Invalid argument value (mode string, negative seek, ...).
    kInvalidArgument = 7,

    /// @brief Opaque backend failure.
    kBackendError = 8,

    /// @brief Operation on a stream in an invalid state (e.g. closed).
    kInvalidState = 9
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kNotFound:
            return "not found";
        case ErrorCode::kPermissionDenied:
            return "permission denied";
        case ErrorCode::kAlreadyExists:
            return "already exists";
        case ErrorCode::kUnsupportedOperation:
            return "unsupported operation";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kBackendError:
            return "backend error";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Object path or URL associated with the error (if applicable).
    std::string path;

    /// @brief Byte offset in the object where the error occurred.
    std::optional<std::uint64_t> byteOffset;

    /// @brief Multi-part upload part number (1-based).
    std::optional<std::uint32_t> partNumber;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string objectPath,
                          std::source_location loc = std::source_location::current())
        : path(std::move(objectPath)), location(loc) {}

    /// @brief Set the object path.
    /// @return Reference to this for method chaining.
    ErrorContext& withPath(std::string objectPath) {
        path = std::move(objectPath);
        return *this;
    }

    /// @brief Set the byte offset.
    /// @return Reference to this for method chaining.
    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Set the part number.
    /// @return Reference to this for method chaining.
    ErrorContext& withPart(std::uint32_t part) {
        partNumber = part;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all objfs errors.
/// @note Provides error code, message, and optional context.
class ObjfsException : public std::exception {
public:
    ObjfsException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    ObjfsException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~ObjfsException() override = default;

    ObjfsException(const ObjfsException&) = default;
    ObjfsException(ObjfsException&&) noexcept = default;
    ObjfsException& operator=(const ObjfsException&) = default;
    ObjfsException& operator=(ObjfsException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for command-line usage errors (exit code 1).
class UsageError : public ObjfsException {
public:
    explicit UsageError(std::string message)
        : ObjfsException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : ObjfsException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for local I/O errors (exit code 2).
class IOError : public ObjfsException {
public:
    explicit IOError(std::string message)
        : ObjfsException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : ObjfsException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : ObjfsException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : ObjfsException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                         std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief The object, file or mount point does not exist.
class NotFoundError : public ObjfsException {
public:
    explicit NotFoundError(std::string message)
        : ObjfsException(ErrorCode::kNotFound, std::move(message)) {}

    NotFoundError(std::string message, ErrorContext context)
        : ObjfsException(ErrorCode::kNotFound, std::move(message), std::move(context)) {}
};

/// @brief The store refused access to the object.
class PermissionDeniedError : public ObjfsException {
public:
    explicit PermissionDeniedError(std::string message)
        : ObjfsException(ErrorCode::kPermissionDenied, std::move(message)) {}

    PermissionDeniedError(std::string message, ErrorContext context)
        : ObjfsException(ErrorCode::kPermissionDenied, std::move(message), std::move(context)) {}
};

/// @brief The object already exists.
/// @note Raised by exclusive-creation opens ("x" mode) before any write.
class AlreadyExistsError : public ObjfsException {
public:
    explicit AlreadyExistsError(std::string message)
        : ObjfsException(ErrorCode::kAlreadyExists, std::move(message)) {}

    AlreadyExistsError(std::string message, ErrorContext context)
        : ObjfsException(ErrorCode::kAlreadyExists, std::move(message), std::move(context)) {}
};

/// @brief Operation not supported by this stream mode or backend.
class UnsupportedOperationError : public ObjfsException {
public:
    explicit UnsupportedOperationError(std::string message)
        : ObjfsException(ErrorCode::kUnsupportedOperation, std::move(message)) {}

    UnsupportedOperationError(std::string message, ErrorContext context)
        : ObjfsException(ErrorCode::kUnsupportedOperation, std::move(message),
                         std::move(context)) {}
};

/// @brief Invalid argument value; fatal at construction, never retried.
class InvalidArgumentError : public ObjfsException {
public:
    explicit InvalidArgumentError(std::string message)
        : ObjfsException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : ObjfsException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief Opaque failure reported by a storage backend.
class BackendError : public ObjfsException {
public:
    explicit BackendError(std::string message)
        : ObjfsException(ErrorCode::kBackendError, std::move(message)) {}

    BackendError(std::string message, ErrorContext context)
        : ObjfsException(ErrorCode::kBackendError, std::move(message), std::move(context)) {}
};

/// @brief Backend failure carrying an HTTP-like status code.
/// @note Backends throw this; the storage boundary maps well-known statuses
///       (403, 404, 409, 412) to the normalized taxonomy.
class StatusError : public BackendError {
public:
    StatusError(int status, std::string message)
        : BackendError(formatStatus(status, message)), status_(status) {}

    [[nodiscard]] int status() const noexcept { return status_; }

private:
    static std::string formatStatus(int status, const std::string& message);

    int status_;
};

/// @brief Operation on a stream in an invalid state.
class InvalidStateError : public ObjfsException {
public:
    explicit InvalidStateError(std::string message)
        : ObjfsException(ErrorCode::kInvalidState, std::move(message)) {}

    InvalidStateError(std::string message, ErrorContext context)
        : ObjfsException(ErrorCode::kInvalidState, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an ObjfsException.
    explicit Error(const ObjfsException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws ObjfsException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const ObjfsException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace objfs

#endif  // OBJFS_COMMON_ERROR_H
