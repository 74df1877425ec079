// =============================================================================
// objfs - Stream Configuration Implementation
// =============================================================================

#include "objfs/common/config.h"

#include <algorithm>
#include <limits>
#include <optional>
#include <thread>

#include <fmt/format.h>

namespace objfs {

// =============================================================================
// OpenMode Implementation
// =============================================================================

Result<OpenMode> OpenMode::parse(std::string_view mode) {
    std::optional<AccessMode> access;
    bool binary = false;

    for (char c : mode) {
        std::optional<AccessMode> next;
        switch (c) {
            case 'r':
                next = AccessMode::kRead;
                break;
            case 'w':
                next = AccessMode::kWrite;
                break;
            case 'a':
                next = AccessMode::kAppend;
                break;
            case 'x':
                next = AccessMode::kExclusive;
                break;
            case 'b':
                if (binary) {
                    return makeError<OpenMode>(ErrorCode::kInvalidArgument,
                                               fmt::format("Invalid mode \"{}\"", mode));
                }
                binary = true;
                continue;
            default:
                return makeError<OpenMode>(ErrorCode::kInvalidArgument,
                                           fmt::format("Invalid mode \"{}\"", mode));
        }
        if (access.has_value()) {
            return makeError<OpenMode>(ErrorCode::kInvalidArgument,
                                       fmt::format("Invalid mode \"{}\"", mode));
        }
        access = next;
    }

    if (!access.has_value()) {
        return makeError<OpenMode>(ErrorCode::kInvalidArgument,
                                   fmt::format("Invalid mode \"{}\"", mode));
    }

    OpenMode result;
    result.access = *access;
    result.binary = binary;
    result.text = std::string(mode);
    return result;
}

OpenMode OpenMode::fromString(std::string_view mode) {
    return unwrapOrThrow(parse(mode));
}

// =============================================================================
// StreamConfig Implementation
// =============================================================================

VoidResult StreamConfig::validate() const {
    constexpr auto kMaxSigned = static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max());
    if (bufferSize > kMaxSigned) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Buffer size {} is too large", bufferSize));
    }
    if (maxWorkers > 1024) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Worker count {} exceeds the limit of 1024", maxWorkers));
    }
    for (const auto& entry : storageParameters) {
        if (entry.first.empty()) {
            return makeVoidError(ErrorCode::kInvalidArgument,
                                 "Storage parameter names must not be empty");
        }
    }
    return makeVoidSuccess();
}

std::size_t defaultWorkerCount() noexcept {
    const std::size_t hardware = std::thread::hardware_concurrency();
    return std::min(kMaxDefaultWorkers, hardware + 4);
}

}  // namespace objfs
