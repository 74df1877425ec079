// =============================================================================
// objfs - Buffered Object Stream
// =============================================================================
// Buffered stream wrapping a RawStream.
//
// Read path:
// - Prefetch window: chunk reads at offsets {seek, seek + B, ...} up to
//   maxBuffers entries, truncated at the object size, run on the worker pool.
// - Chunks are indexed by offset, so bytes come back contiguous and in
//   request order whatever the completion order.
// - Fully consumed chunks are dropped and the chunk maxBuffers positions
//   ahead is queued to keep the window full.
// - seek() rebuilds the window. Chunks outside it are dropped without
//   cancellation: an in-flight read completes and its result is discarded.
// - A failed chunk read raises when that chunk is consumed.
//
// Write path:
// - Writes fill a buffer of B bytes; a full buffer becomes a part submitted
//   to the pool with a 1-based part number.
// - With maxBuffers > 0, submitting blocks (poll/sleep) while maxBuffers
//   parts are still in flight.
// - close() flushes the last part and finalizes by part number. An object
//   that never exceeded one buffer is written by the raw stream's single
//   flush instead of a multi-part upload.
// - Append mode and seeking are not supported for writing.
// =============================================================================

#ifndef OBJFS_IO_BUFFERED_STREAM_H
#define OBJFS_IO_BUFFERED_STREAM_H

#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "objfs/common/config.h"
#include "objfs/common/types.h"
#include "objfs/io/object_stream.h"
#include "objfs/io/raw_stream.h"
#include "objfs/io/worker_pool.h"
#include "objfs/storage/system.h"

namespace objfs::io {

class BufferedStream : public ObjectStream {
public:
    /// @brief Wrap a raw stream.
    /// @param raw Raw stream opened with the same mode.
    /// @param config bufferSize, maxBuffers and maxWorkers are used.
    /// @throws UnsupportedOperationError for append mode or backends without
    ///         multi-part or range-write support (write modes).
    BufferedStream(std::unique_ptr<RawStream> raw, const StreamConfig& config);

    ~BufferedStream() override;

    [[nodiscard]] ByteBuffer read(std::int64_t size = -1) override;
    std::size_t readinto(MutableByteSpan buffer) override;
    [[nodiscard]] ByteBuffer readall() override;
    std::size_t write(ByteSpan data) override;
    Offset seek(std::int64_t offset, Whence whence = Whence::kSet) override;
    [[nodiscard]] Offset tell() const override;
    void flush() override;
    void close() override;

    /// @brief Bytes from the current position without advancing it.
    [[nodiscard]] ByteBuffer peek(std::int64_t size = -1);

    [[nodiscard]] RawStream& raw() noexcept { return *raw_; }
    [[nodiscard]] std::size_t bufferSize() const noexcept { return bufferSize_; }
    [[nodiscard]] std::size_t maxBuffers() const noexcept { return maxBuffers_; }

    /// @brief Offsets currently queued or in flight (read mode), ascending.
    [[nodiscard]] std::vector<Offset> queuedOffsets() const;

    /// @brief Number of parts submitted so far (write mode).
    [[nodiscard]] PartNumber partCount() const;

protected:
    /// @brief Submitted part awaiting its backend acknowledgment.
    struct PendingPart {
        PartNumber number = 0;
        std::shared_future<storage::PartInfo> result;
    };

    /// @brief Submit one part to the pool. Called with seekMutex_ held.
    /// @param start Offset of the part's first byte in the object.
    virtual void submitPart(PartNumber number, std::shared_ptr<const ByteBuffer> data,
                            Offset start);

    /// @brief Finalize the object once all parts are submitted.
    virtual void closeWritable();

    /// @brief Worker pool, created on first use.
    [[nodiscard]] WorkerPool& workers();

    /// @brief Join the pool; derived destructors call this before their
    ///        members used by pool tasks are destroyed.
    void resetPool();

    /// @brief Wait for every part, returning results sorted by part number.
    /// @throws The first part error after all parts resolved.
    [[nodiscard]] std::vector<storage::PartInfo> waitForParts();

    std::unique_ptr<RawStream> raw_;
    std::vector<PendingPart> writeFutures_;

private:
    struct ReadChunk {
        std::future<ByteBuffer> pending;
        std::optional<ByteBuffer> data;
    };

    using ChunkQueue = std::map<Offset, ReadChunk>;

    void preloadRange();
    void queueChunk(Offset offset);
    [[nodiscard]] ChunkQueue::iterator chunkAt(Offset position);
    [[nodiscard]] const ByteBuffer& resolve(ChunkQueue::iterator it);
    void consumed(ChunkQueue::iterator it);

    void waitForSlot();
    void flushPart();
    void abortUpload() noexcept;

    std::size_t bufferSize_;
    std::size_t maxBuffers_ = 0;
    std::size_t maxWorkers_;

    // Read state
    Offset size_ = 0;
    ChunkQueue readQueue_;
    bool preloaded_ = false;

    // Write state
    ByteBuffer writeBuffer_;
    std::size_t bufferSeek_ = 0;
    Offset bytesFlushed_ = 0;
    PartNumber partCount_ = 0;
    std::unique_ptr<storage::PartUpload> upload_;

    std::once_flag poolOnce_;
    std::unique_ptr<WorkerPool> pool_;
};

}  // namespace objfs::io

#endif  // OBJFS_IO_BUFFERED_STREAM_H
