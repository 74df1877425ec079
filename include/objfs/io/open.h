// =============================================================================
// objfs - Stream Factory and Object Functions
// =============================================================================
// open() resolves the storage system of a path and builds the matching
// stream:
//
//   mode "a" or config.buffered == false  -> RawStream
//                                            (RandomWriteRaw on random-write
//                                            backends)
//   otherwise                             -> BufferedStream
//                                            (RandomWriteBuffered on
//                                            random-write backends)
//
// The returned stream closes itself when destroyed.
// =============================================================================

#ifndef OBJFS_IO_OPEN_H
#define OBJFS_IO_OPEN_H

#include <cstdint>
#include <memory>
#include <string_view>

#include "objfs/common/config.h"
#include "objfs/common/types.h"
#include "objfs/io/object_stream.h"
#include "objfs/storage/registry.h"

namespace objfs::io {

/// @brief Open an object.
/// @param registry Mount table resolving the path.
/// @param path Object path or URL.
/// @param mode "r", "w", "a" or "x", optionally with "b".
/// @param config Buffering and backend options.
/// @throws InvalidArgumentError, NotFoundError, PermissionDeniedError,
///         AlreadyExistsError, UnsupportedOperationError
[[nodiscard]] std::unique_ptr<ObjectStream> open(const storage::StorageRegistry& registry,
                                                 std::string_view path,
                                                 std::string_view mode = "r",
                                                 const StreamConfig& config = {});

// =============================================================================
// Object Functions
// =============================================================================

/// @brief Check whether an object exists.
/// @throws PermissionDeniedError if existence cannot be determined.
[[nodiscard]] bool exists(const storage::StorageRegistry& registry, std::string_view path);

/// @brief Object size in bytes.
[[nodiscard]] Offset getSize(const storage::StorageRegistry& registry, std::string_view path);

/// @brief Modification time in seconds since epoch.
[[nodiscard]] std::int64_t getMtime(const storage::StorageRegistry& registry,
                                    std::string_view path);

/// @brief Copy an object through buffered streams.
/// @return Number of bytes copied.
Offset copyObject(const storage::StorageRegistry& registry, std::string_view source,
                  std::string_view destination, const StreamConfig& config = {});

}  // namespace objfs::io

#endif  // OBJFS_IO_OPEN_H
