// =============================================================================
// objfs - Stream Configuration
// =============================================================================
// Open mode parsing and per-stream tuning knobs.
//
// OpenMode accepts exactly one of 'r', 'w', 'a', 'x' plus an optional 'b'.
// A stream is either readable or writable, never both.
//
// StreamConfig values of 0 select the backend default (buffer size, workers)
// or "derive from the object" (max buffers, see BufferedStream).
// =============================================================================

#ifndef OBJFS_COMMON_CONFIG_H
#define OBJFS_COMMON_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "objfs/common/error.h"
#include "objfs/common/types.h"

namespace objfs {

// =============================================================================
// Open Mode
// =============================================================================

/// @brief Primary access of an open mode.
enum class AccessMode : std::uint8_t {
    kRead = 0,
    kWrite,
    kAppend,
    kExclusive
};

/// @brief Parsed open mode.
struct OpenMode {
    AccessMode access = AccessMode::kRead;
    bool binary = false;

    /// @brief Original mode string ("rb", "w", ...).
    std::string text = "r";

    [[nodiscard]] bool readable() const noexcept { return access == AccessMode::kRead; }
    [[nodiscard]] bool writable() const noexcept { return access != AccessMode::kRead; }

    /// @brief Parse a mode string.
    /// @return The mode, or kInvalidArgument for unrecognized strings.
    [[nodiscard]] static Result<OpenMode> parse(std::string_view mode);

    /// @brief Parse a mode string, throwing InvalidArgumentError on failure.
    [[nodiscard]] static OpenMode fromString(std::string_view mode);
};

// =============================================================================
// Stream Configuration
// =============================================================================

/// @brief Tuning options passed to open().
struct StreamConfig {
    /// @brief Chunk / part size in bytes; 0 = backend default.
    /// @note Clamped to the backend's [minimum, maximum] buffer size.
    std::size_t bufferSize = 0;

    /// @brief Maximum number of buffers in flight.
    /// @note Read: 0 = ceil(size / bufferSize). Write: 0 = unbounded.
    std::size_t maxBuffers = 0;

    /// @brief Worker pool size; 0 = backend default.
    std::size_t maxWorkers = 0;

    /// @brief Open a BufferedStream (true) or a RawStream (false).
    bool buffered = true;

    /// @brief Backend-specific parameters, applied with System::withParameters.
    Parameters storageParameters;

    /// @brief Validate option values.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Default worker count: min(32, hardware threads + 4).
[[nodiscard]] std::size_t defaultWorkerCount() noexcept;

}  // namespace objfs

#endif  // OBJFS_COMMON_CONFIG_H
