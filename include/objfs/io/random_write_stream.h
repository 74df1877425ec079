// =============================================================================
// objfs - Random-Write Object Streams
// =============================================================================
// Streams for backends that update byte ranges in place (page and append
// blobs, local files). Flushes carry an explicit [start, end) instead of
// replacing the whole object.
//
// RandomWriteRaw:
// - The buffer holds one contiguous run ending at the current position.
// - seek() flushes that run first, then moves.
// - Append mode positions at the current size without loading content.
//
// RandomWriteBuffered:
// - Parts are range writes at their byte offset in the object.
// - RangeSizeTracker keeps the known remote size: synchronized once from
//   the backend (0 if the object does not exist), then grown to each landed
//   range's end. A range whose start lies past the known size waits until
//   earlier ranges land, so the remote object never has gaps.
// =============================================================================

#ifndef OBJFS_IO_RANDOM_WRITE_STREAM_H
#define OBJFS_IO_RANDOM_WRITE_STREAM_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "objfs/common/config.h"
#include "objfs/common/types.h"
#include "objfs/io/buffered_stream.h"
#include "objfs/io/raw_stream.h"
#include "objfs/storage/system.h"

namespace objfs::io {

// =============================================================================
// RandomWriteRaw
// =============================================================================

class RandomWriteRaw : public RawStream {
public:
    RandomWriteRaw(std::shared_ptr<storage::System> system, std::string name, OpenMode mode);

    ~RandomWriteRaw() override;

    Offset seek(std::int64_t offset, Whence whence = Whence::kSet) override;

protected:
    void initAppend() override;
    void create() override;
    void flushBuffer() override;
    [[nodiscard]] Offset currentSize() override;

private:
    /// @brief Largest end offset flushed so far (or the size found on append).
    Offset knownSize_ = 0;
};

// =============================================================================
// RangeSizeTracker
// =============================================================================

/// @brief Remote size of an object receiving concurrent range writes.
/// @note Size only grows.
class RangeSizeTracker {
public:
    /// @brief Synchronize with the backend on first call.
    /// @param fetchSize Returns the remote size; NotFoundError and
    ///        UnsupportedOperationError count as size 0.
    void synchronize(const std::function<Offset()>& fetchSize);

    /// @brief Block until start <= known size (poll/sleep).
    /// @throws BackendError if an earlier range write failed.
    void waitUntilReachable(Offset start) const;

    /// @brief Record a landed range: size = max(size, end).
    void update(Offset end);

    /// @brief Release waiters after a failed range write.
    void markFailed() noexcept { failed_.store(true, std::memory_order_release); }

    [[nodiscard]] Offset size() const;

private:
    mutable std::mutex mutex_;
    Offset size_ = 0;
    bool synchronized_ = false;
    std::atomic<bool> failed_{false};
};

// =============================================================================
// RandomWriteBuffered
// =============================================================================

class RandomWriteBuffered : public BufferedStream {
public:
    RandomWriteBuffered(std::unique_ptr<RandomWriteRaw> raw, const StreamConfig& config);

    ~RandomWriteBuffered() override;

    [[nodiscard]] const RangeSizeTracker& sizeTracker() const noexcept { return tracker_; }

protected:
    void submitPart(PartNumber number, std::shared_ptr<const ByteBuffer> data,
                    Offset start) override;
    void closeWritable() override;

private:
    RangeSizeTracker tracker_;
};

}  // namespace objfs::io

#endif  // OBJFS_IO_RANDOM_WRITE_STREAM_H
