// =============================================================================
// objfs - Common Type Definitions
// =============================================================================
// Core type definitions shared by the storage and I/O layers.
//
// This module defines:
// - ByteBuffer / ByteSpan: owned and borrowed byte ranges
// - Offset, PartNumber: position and multi-part index types
// - Whence: seek origin
// - Engine-wide constants (default buffer size, poll interval, workers)
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef OBJFS_COMMON_TYPES_H
#define OBJFS_COMMON_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace objfs {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Owned byte buffer.
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Read-only view over bytes.
using ByteSpan = std::span<const std::uint8_t>;

/// @brief Writable view over bytes (readinto destination).
using MutableByteSpan = std::span<std::uint8_t>;

/// @brief Byte position or size inside an object.
using Offset = std::uint64_t;

/// @brief Multi-part upload part index.
/// @note Part numbers are 1-based and sequential in submission order.
using PartNumber = std::uint32_t;

/// @brief Backend-specific string parameters (storage_parameters).
using Parameters = std::map<std::string, std::string>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default buffer (chunk / part) size: 8 MiB.
inline constexpr std::size_t kDefaultBufferSize = 8 * 1024 * 1024;

/// @brief Interval of the fixed poll/sleep loops (write backpressure and
///        random-write size catch-up).
inline constexpr std::chrono::milliseconds kFlushPollInterval{10};

/// @brief Upper bound of the default worker count.
inline constexpr std::size_t kMaxDefaultWorkers = 32;

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Seek origin, matching SEEK_SET / SEEK_CUR / SEEK_END.
enum class Whence : std::uint8_t {
    kSet = 0,
    kCur = 1,
    kEnd = 2
};

/// @brief Build a byte buffer from a string (convenience for callers and tests).
[[nodiscard]] inline ByteBuffer toBytes(const std::string& text) {
    return ByteBuffer(text.begin(), text.end());
}

/// @brief Build a string from a byte range.
[[nodiscard]] inline std::string toString(ByteSpan bytes) {
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace objfs

#endif  // OBJFS_COMMON_TYPES_H
