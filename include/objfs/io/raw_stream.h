// =============================================================================
// objfs - Raw Object Stream
// =============================================================================
// Unbuffered stream over one object.
//
// Read mode:  every read is a byte-range request [seek, seek + n) against
//             the backend; short reads at EOF are not errors. The object
//             header is fetched once on open and cached.
// Write mode: the whole object is built in memory and transmitted by a
//             single flush on flush()/close(). Writes past the end and
//             seeks past the end zero-fill the gap.
//
// Open-time behaviour by mode:
//   "r"  head the object (NotFound / PermissionDenied)
//   "w"  create an empty object immediately
//   "x"  AlreadyExists if the object exists, else create
//   "a"  load the existing object into the buffer (create if missing)
//
// Subclasses that override initAppend()/create() construct through the
// DeferInit constructor and call initialize() from their own constructor
// so the overrides are dispatched.
// =============================================================================

#ifndef OBJFS_IO_RAW_STREAM_H
#define OBJFS_IO_RAW_STREAM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "objfs/common/config.h"
#include "objfs/common/error.h"
#include "objfs/common/types.h"
#include "objfs/io/object_stream.h"
#include "objfs/storage/system.h"

namespace objfs::io {

class RawStream : public ObjectStream {
public:
    /// @brief Open a raw stream.
    /// @throws InvalidArgumentError, NotFoundError, PermissionDeniedError,
    ///         AlreadyExistsError
    RawStream(std::shared_ptr<storage::System> system, std::string name, OpenMode mode);

    ~RawStream() override;

    std::size_t readinto(MutableByteSpan buffer) override;
    [[nodiscard]] ByteBuffer readall() override;
    std::size_t write(ByteSpan data) override;
    Offset seek(std::int64_t offset, Whence whence = Whence::kSet) override;
    void flush() override;
    void close() override;

    /// @brief Bytes from the current position without advancing it.
    /// @param size Number of bytes; negative reads to EOF.
    [[nodiscard]] ByteBuffer peek(std::int64_t size = -1);

    // -------------------------------------------------------------------------
    // Metadata
    // -------------------------------------------------------------------------

    /// @brief Cached object header (fetched on first use).
    [[nodiscard]] storage::Header header();

    /// @brief Drop the cached header.
    void resetHeader();

    /// @brief Object size: the header size in read mode, the written size
    ///        in write mode.
    [[nodiscard]] Offset size();

    /// @brief Modification time from the header (seconds since epoch).
    [[nodiscard]] std::int64_t mtime();

    /// @brief Existence from the cached header.
    /// @return true / false, or std::nullopt when access is denied.
    [[nodiscard]] std::optional<bool> exists();

    /// @brief Size currently stored remotely (fresh head request).
    /// @throws NotFoundError if the object does not exist yet.
    [[nodiscard]] Offset remoteSize();

    // -------------------------------------------------------------------------
    // Primitives shared with BufferedStream (thread-safe)
    // -------------------------------------------------------------------------

    /// @brief Normalized backend range read; end == 0 reads to EOF.
    [[nodiscard]] ByteBuffer readRange(Offset start, Offset end);

    /// @brief Normalized backend range write, split by the backend's
    ///        maximum flush size.
    void writeRange(ByteSpan data, Offset start);

    /// @brief Replace the buffer with data and transmit it in one flush.
    /// @note Used by BufferedStream for objects smaller than one buffer.
    void flushWhole(ByteSpan data);

    /// @brief Hand write transmission over to an owning BufferedStream:
    ///        close() no longer flushes.
    void attachToBuffered() noexcept { ownedByBuffered_ = true; }

    [[nodiscard]] storage::System& system() noexcept { return *system_; }
    [[nodiscard]] const storage::ClientArgs& clientArgs() const noexcept { return clientArgs_; }
    [[nodiscard]] storage::ObjectBackend& backend() noexcept { return *backend_; }
    [[nodiscard]] const storage::BackendTraits& traits() const noexcept { return traits_; }

protected:
    struct DeferInit {};

    /// @brief Construct without running the open-time behaviour.
    RawStream(DeferInit, std::shared_ptr<storage::System> system, std::string name,
              OpenMode mode);

    /// @brief Run the open-time behaviour for the stream's mode.
    void initialize();

    /// @brief Prepare an existing object for appending.
    virtual void initAppend();

    /// @brief Create the object if it does not exist.
    virtual void create();

    /// @brief Transmit the write buffer. Called with seekMutex_ held.
    virtual void flushBuffer();

    /// @brief Size used by SEEK_END. Called with seekMutex_ held.
    [[nodiscard]] virtual Offset currentSize();

    /// @brief Compute and store the new position. Called with seekMutex_ held.
    Offset updateSeek(std::int64_t offset, Whence whence);

    [[nodiscard]] ErrorContext context() const { return ErrorContext(name_); }

    std::shared_ptr<storage::System> system_;
    storage::ClientArgs clientArgs_;
    storage::BackendTraits traits_;
    std::unique_ptr<storage::ObjectBackend> backend_;

    /// @brief Write buffer holding bytes [bufferOffset_, bufferOffset_ + size).
    ByteBuffer buffer_;
    Offset bufferOffset_ = 0;

    /// @brief Set by writes; cleared by a successful flush.
    bool dirty_ = false;

private:
    bool ownedByBuffered_ = false;

    std::mutex headerMutex_;
    std::optional<storage::Header> header_;
};

}  // namespace objfs::io

#endif  // OBJFS_IO_RAW_STREAM_H
