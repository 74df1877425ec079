// =============================================================================
// objfs - Storage System Interface
// =============================================================================
// Boundary between the streaming engine and concrete object stores.
//
// A System knows how to address objects (roots, relative paths, client
// arguments), fetch their metadata (head) and open an ObjectBackend that
// supplies the byte-level primitives the streams need:
//
//   readRange(start, end)        end == 0 reads to EOF
//   readAll()
//   flush(buffer)                replaces the whole object
//   flushRange(buffer, start, end)   random-write backends only
//   create()                     creates an empty object immediately
//   startPartUpload()            multipart backends only
//
// Backends report failures as StatusError (HTTP-like status) or
// std::system_error; callers run them inside normalizeErrors() to obtain
// the NotFound / PermissionDenied / AlreadyExists taxonomy.
// =============================================================================

#ifndef OBJFS_STORAGE_SYSTEM_H
#define OBJFS_STORAGE_SYSTEM_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "objfs/common/types.h"

namespace objfs::storage {

// =============================================================================
// Types
// =============================================================================

/// @brief Object header (metadata) as returned by head().
using Header = std::map<std::string, std::string>;

/// @brief Header key holding the object size in bytes.
inline constexpr std::string_view kContentLength = "Content-Length";

/// @brief Header key holding the modification time in seconds since epoch.
inline constexpr std::string_view kLastModified = "Last-Modified";

/// @brief Backend addressing of one object.
struct ClientArgs {
    /// @brief Top-level container (bucket, container, share or directory).
    std::string locator;

    /// @brief Object key inside the locator.
    std::string key;

    /// @brief Full path or URL as given by the caller.
    std::string path;
};

/// @brief Capabilities and limits declared by a backend.
struct BackendTraits {
    /// @brief Smallest accepted buffer size.
    std::size_t minimumBufferSize = 1;

    /// @brief Largest accepted buffer size (0 = no limit).
    std::size_t maximumBufferSize = 0;

    /// @brief Buffer size used when the caller passes 0.
    std::size_t defaultBufferSize = kDefaultBufferSize;

    /// @brief Worker count used when the caller passes 0 (0 = defaultWorkerCount()).
    std::size_t defaultMaxWorkers = 0;

    /// @brief Backend supports flushRange (page/append blobs, local files).
    bool randomWrite = false;

    /// @brief Backend supports multi-part uploads.
    bool multipart = false;

    /// @brief Largest single range flush (0 = no limit).
    std::size_t maxFlushSize = 0;

    /// @brief Clamp a requested buffer size to [minimum, maximum]; 0 selects the default.
    [[nodiscard]] std::size_t clampBufferSize(std::size_t requested) const noexcept;

    /// @brief Resolve a requested worker count; 0 selects the default.
    [[nodiscard]] std::size_t resolveWorkers(std::size_t requested) const noexcept;
};

/// @brief Result of one uploaded part.
struct PartInfo {
    PartNumber number = 0;
    std::string etag;
    std::size_t size = 0;
};

// =============================================================================
// PartUpload
// =============================================================================

/// @brief One in-progress multi-part upload.
/// @note uploadPart() is called concurrently from pool workers.
class PartUpload {
public:
    virtual ~PartUpload() = default;

    /// @brief Upload one part.
    /// @return Backend acknowledgment (ETag).
    [[nodiscard]] virtual std::string uploadPart(PartNumber number, ByteSpan data) = 0;

    /// @brief Assemble the object from parts, ordered by part number.
    virtual void complete(const std::vector<PartInfo>& parts) = 0;

    /// @brief Discard uploaded parts.
    virtual void abort() = 0;
};

// =============================================================================
// ObjectBackend
// =============================================================================

/// @brief Byte-level primitives for one object.
/// @note readRange() and flushRange() are called concurrently from pool workers.
class ObjectBackend {
public:
    virtual ~ObjectBackend() = default;

    /// @brief Read [start, end); end == 0 reads to EOF.
    /// @return Bytes read; empty when start is at or beyond EOF.
    [[nodiscard]] virtual ByteBuffer readRange(Offset start, Offset end) = 0;

    /// @brief Read the whole object.
    [[nodiscard]] virtual ByteBuffer readAll() { return readRange(0, 0); }

    /// @brief Replace the object content.
    virtual void flush(ByteSpan data) = 0;

    /// @brief Write data at [start, end), zero-filling any gap past EOF.
    /// @throws UnsupportedOperationError unless the backend supports random write.
    virtual void flushRange(ByteSpan data, Offset start, Offset end);

    /// @brief Create an empty object (truncating an existing one).
    virtual void create() { flush(ByteSpan{}); }

    /// @brief Start a multi-part upload replacing the object on complete.
    /// @throws UnsupportedOperationError unless the backend supports multipart.
    [[nodiscard]] virtual std::unique_ptr<PartUpload> startPartUpload();
};

// =============================================================================
// System
// =============================================================================

class System {
public:
    virtual ~System() = default;

    /// @brief Short backend name ("local", "memory", ...).
    [[nodiscard]] virtual std::string_view storageName() const noexcept = 0;

    /// @brief Path prefixes handled by this system ("/", "file://", "mem://").
    [[nodiscard]] virtual std::vector<std::string> roots() const = 0;

    /// @brief Path relative to the longest matching root.
    [[nodiscard]] virtual std::string relpath(std::string_view path) const;

    /// @brief Split a path into backend addressing.
    [[nodiscard]] virtual ClientArgs getClientArgs(std::string_view path) const = 0;

    /// @brief Fetch object metadata.
    /// @throws NotFoundError, PermissionDeniedError
    [[nodiscard]] Header head(const ClientArgs& args);

    /// @brief Object size from a header.
    /// @throws UnsupportedOperationError if the header carries no size.
    [[nodiscard]] virtual Offset getSize(const Header& header) const;

    /// @brief Modification time (seconds since epoch) from a header.
    /// @throws UnsupportedOperationError if the header carries no time.
    [[nodiscard]] virtual std::int64_t getMtime(const Header& header) const;

    /// @brief Check existence.
    /// @return true / false, or std::nullopt when access is denied.
    [[nodiscard]] std::optional<bool> exists(const ClientArgs& args);

    /// @brief Open the byte-level backend of one object.
    [[nodiscard]] virtual std::unique_ptr<ObjectBackend> openObject(const ClientArgs& args) = 0;

    [[nodiscard]] virtual BackendTraits traits() const = 0;

    /// @brief Parameters this system was configured with.
    [[nodiscard]] virtual Parameters storageParameters() const { return {}; }

    /// @brief Copy of this system with additional parameters applied.
    /// @throws InvalidArgumentError for unknown or malformed parameters.
    [[nodiscard]] virtual std::shared_ptr<System> withParameters(
        const Parameters& parameters) const = 0;

protected:
    /// @brief Backend metadata call; may throw StatusError / std::system_error.
    [[nodiscard]] virtual Header headObject(const ClientArgs& args) = 0;
};

}  // namespace objfs::storage

#endif  // OBJFS_STORAGE_SYSTEM_H
