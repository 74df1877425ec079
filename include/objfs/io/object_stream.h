// =============================================================================
// objfs - Object Stream Interface
// =============================================================================
// POSIX-like file interface shared by raw and buffered object streams.
//
// A stream is single-owner: callers must not use one stream from several
// threads, although its worker pool runs backend calls concurrently with
// the owner. seek_ is only mutated while holding seekMutex_.
//
// Destroying a stream closes it; errors raised by that implicit close are
// logged, so call close() explicitly to observe them.
// =============================================================================

#ifndef OBJFS_IO_OBJECT_STREAM_H
#define OBJFS_IO_OBJECT_STREAM_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include "objfs/common/config.h"
#include "objfs/common/types.h"

namespace objfs::io {

class ObjectStream {
public:
    ObjectStream(std::string name, OpenMode mode);
    virtual ~ObjectStream() = default;

    ObjectStream(const ObjectStream&) = delete;
    ObjectStream& operator=(const ObjectStream&) = delete;
    ObjectStream(ObjectStream&&) = delete;
    ObjectStream& operator=(ObjectStream&&) = delete;

    // -------------------------------------------------------------------------
    // Properties
    // -------------------------------------------------------------------------

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const OpenMode& mode() const noexcept { return mode_; }
    [[nodiscard]] bool readable() const noexcept { return readable_; }
    [[nodiscard]] bool writable() const noexcept { return writable_; }
    [[nodiscard]] bool seekable() const noexcept { return seekable_; }
    [[nodiscard]] bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    // -------------------------------------------------------------------------
    // I/O
    // -------------------------------------------------------------------------

    /// @brief Read up to size bytes; a negative size reads to EOF.
    /// @return Bytes read; empty at EOF.
    [[nodiscard]] virtual ByteBuffer read(std::int64_t size = -1);

    /// @brief Read into a caller buffer.
    /// @return Number of bytes copied; 0 at EOF.
    virtual std::size_t readinto(MutableByteSpan buffer) = 0;

    /// @brief Read from the current position to EOF.
    [[nodiscard]] virtual ByteBuffer readall() = 0;

    /// @brief Write bytes at the current position.
    /// @return Number of bytes written (always data.size()).
    virtual std::size_t write(ByteSpan data) = 0;

    /// @brief Change the stream position.
    /// @return The new absolute position.
    virtual Offset seek(std::int64_t offset, Whence whence = Whence::kSet) = 0;

    /// @brief Current stream position.
    [[nodiscard]] virtual Offset tell() const;

    /// @brief Send buffered data to the storage.
    virtual void flush() = 0;

    /// @brief Flush and close; idempotent.
    virtual void close() = 0;

protected:
    void checkReadable() const;
    void checkWritable() const;
    void checkOpen() const;

    /// @brief Mark the stream closed.
    /// @return true if it was already closed.
    bool markClosed() noexcept { return closed_.exchange(true, std::memory_order_acq_rel); }

    std::string name_;
    OpenMode mode_;
    Offset seek_ = 0;
    mutable std::mutex seekMutex_;
    bool readable_ = false;
    bool writable_ = false;
    bool seekable_ = true;

private:
    std::atomic<bool> closed_{false};
};

}  // namespace objfs::io

#endif  // OBJFS_IO_OBJECT_STREAM_H
