// =============================================================================
// objfs - Backend Exception Normalization
// =============================================================================
// Every backend call runs inside normalizeErrors(), which maps
// backend-specific failures to the closed taxonomy:
//
//   StatusError 403              -> PermissionDeniedError
//   StatusError 404              -> NotFoundError
//   StatusError 409 / 412        -> AlreadyExistsError
//   system_error EACCES / EPERM  -> PermissionDeniedError
//   system_error ENOENT/ENOTDIR  -> NotFoundError
//   system_error EEXIST          -> AlreadyExistsError
//
// Anything else propagates unchanged. No retry happens here.
// =============================================================================

#ifndef OBJFS_STORAGE_ERROR_MAPPING_H
#define OBJFS_STORAGE_ERROR_MAPPING_H

#include <system_error>
#include <utility>

#include "objfs/common/error.h"

namespace objfs::storage {

/// @brief Rethrow the status error currently being handled, normalized.
/// @note Must be called from inside a catch block.
[[noreturn]] void rethrowNormalized(const StatusError& ex, const ErrorContext& context);

/// @brief Rethrow the system error currently being handled, normalized.
/// @note Must be called from inside a catch block.
[[noreturn]] void rethrowNormalized(const std::system_error& ex, const ErrorContext& context);

/// @brief Run a backend call, normalizing its failures.
template <typename F>
decltype(auto) normalizeErrors(F&& func, const ErrorContext& context = ErrorContext{}) {
    try {
        return std::forward<F>(func)();
    } catch (const StatusError& ex) {
        rethrowNormalized(ex, context);
    } catch (const std::system_error& ex) {
        rethrowNormalized(ex, context);
    }
}

}  // namespace objfs::storage

#endif  // OBJFS_STORAGE_ERROR_MAPPING_H
