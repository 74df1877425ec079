// =============================================================================
// objfs - Backend Exception Normalization Implementation
// =============================================================================

#include "objfs/storage/error_mapping.h"

namespace objfs::storage {

void rethrowNormalized(const StatusError& ex, const ErrorContext& context) {
    switch (ex.status()) {
        case 403:
            throw PermissionDeniedError(ex.message(), context);
        case 404:
            throw NotFoundError(ex.message(), context);
        case 409:
        case 412:
            throw AlreadyExistsError(ex.message(), context);
        default:
            throw;
    }
}

void rethrowNormalized(const std::system_error& ex, const ErrorContext& context) {
    const std::error_code& code = ex.code();
    if (code == std::errc::no_such_file_or_directory || code == std::errc::not_a_directory) {
        throw NotFoundError(ex.what(), context);
    }
    if (code == std::errc::permission_denied || code == std::errc::operation_not_permitted) {
        throw PermissionDeniedError(ex.what(), context);
    }
    if (code == std::errc::file_exists) {
        throw AlreadyExistsError(ex.what(), context);
    }
    throw;
}

}  // namespace objfs::storage
