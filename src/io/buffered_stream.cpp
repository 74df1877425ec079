// =============================================================================
// objfs - Buffered Object Stream Implementation
// =============================================================================

#include "objfs/io/buffered_stream.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "objfs/common/error.h"
#include "objfs/common/logger.h"
#include "objfs/storage/error_mapping.h"

namespace objfs::io {

using storage::normalizeErrors;

// =============================================================================
// Construction
// =============================================================================

BufferedStream::BufferedStream(std::unique_ptr<RawStream> raw, const StreamConfig& config)
    : ObjectStream(raw ? raw->name() : std::string(), raw ? raw->mode() : OpenMode{}),
      raw_(std::move(raw)),
      bufferSize_(0),
      maxWorkers_(0) {
    if (!raw_) {
        throw InvalidArgumentError("Buffered stream requires a raw stream");
    }
    raw_->attachToBuffered();

    const storage::BackendTraits& traits = raw_->traits();
    bufferSize_ = traits.clampBufferSize(config.bufferSize);
    maxWorkers_ = traits.resolveWorkers(config.maxWorkers);

    if (writable_) {
        if (mode_.access == AccessMode::kAppend) {
            throw UnsupportedOperationError("Append mode is not supported by buffered streams",
                                            ErrorContext(name_));
        }
        if (!traits.multipart && !traits.randomWrite) {
            throw UnsupportedOperationError(
                fmt::format("{} storage supports neither multi-part nor range writes",
                            raw_->system().storageName()),
                ErrorContext(name_));
        }
        maxBuffers_ = config.maxBuffers;
        writeBuffer_.assign(bufferSize_, 0);
        seekable_ = false;
    } else {
        size_ = raw_->size();
        seekable_ = raw_->seekable();
        maxBuffers_ = (config.maxBuffers != 0)
                          ? config.maxBuffers
                          : static_cast<std::size_t>((size_ + bufferSize_ - 1) / bufferSize_);
    }
    OBJFS_LOG_DEBUG("Buffered stream on \"{}\": buffer {} bytes, max buffers {}, {} workers",
                    name_, bufferSize_, maxBuffers_, maxWorkers_);
}

BufferedStream::~BufferedStream() {
    try {
        close();
    } catch (const std::exception& ex) {
        OBJFS_LOG_ERROR("Closing \"{}\" failed: {}", name_, ex.what());
    }
}

WorkerPool& BufferedStream::workers() {
    std::call_once(poolOnce_, [this]() { pool_ = std::make_unique<WorkerPool>(maxWorkers_); });
    return *pool_;
}

void BufferedStream::resetPool() {
    pool_.reset();
}

std::vector<Offset> BufferedStream::queuedOffsets() const {
    std::lock_guard<std::mutex> lock(seekMutex_);
    std::vector<Offset> offsets;
    offsets.reserve(readQueue_.size());
    for (const auto& entry : readQueue_) {
        offsets.push_back(entry.first);
    }
    return offsets;
}

PartNumber BufferedStream::partCount() const {
    std::lock_guard<std::mutex> lock(seekMutex_);
    return partCount_;
}

// =============================================================================
// Read path
// =============================================================================

void BufferedStream::queueChunk(Offset offset) {
    RawStream* raw = raw_.get();
    const Offset end = offset + bufferSize_;
    readQueue_.emplace(
        offset,
        ReadChunk{workers().submit([raw, offset, end]() { return raw->readRange(offset, end); }),
                  std::nullopt});
}

void BufferedStream::preloadRange() {
    std::vector<Offset> window;
    window.reserve(maxBuffers_);
    for (std::size_t i = 0; i < maxBuffers_; ++i) {
        const Offset offset = seek_ + static_cast<Offset>(i) * bufferSize_;
        if (offset >= size_) {
            break;
        }
        window.push_back(offset);
    }

    // Dropped chunks are not cancelled; their results are discarded
    for (auto it = readQueue_.begin(); it != readQueue_.end();) {
        if (std::binary_search(window.begin(), window.end(), it->first)) {
            ++it;
        } else {
            it = readQueue_.erase(it);
        }
    }

    for (const Offset offset : window) {
        if (!readQueue_.contains(offset)) {
            queueChunk(offset);
        }
    }
    OBJFS_LOG_TRACE("Prefetch window of \"{}\" at {}: {} chunks", name_, seek_, window.size());
}

BufferedStream::ChunkQueue::iterator BufferedStream::chunkAt(Offset position) {
    auto it = readQueue_.upper_bound(position);
    if (it == readQueue_.begin()) {
        return readQueue_.end();
    }
    --it;
    if (position >= it->first + bufferSize_) {
        return readQueue_.end();
    }
    return it;
}

const ByteBuffer& BufferedStream::resolve(ChunkQueue::iterator it) {
    ReadChunk& chunk = it->second;
    if (!chunk.data.has_value()) {
        try {
            chunk.data = chunk.pending.get();
        } catch (const std::exception&) {
            readQueue_.erase(it);
            throw;
        }
    }
    return *chunk.data;
}

void BufferedStream::consumed(ChunkQueue::iterator it) {
    const Offset ahead = it->first + static_cast<Offset>(bufferSize_) * maxBuffers_;
    readQueue_.erase(it);
    if (ahead < size_ && !readQueue_.contains(ahead)) {
        queueChunk(ahead);
    }
}

ByteBuffer BufferedStream::read(std::int64_t size) {
    if (size < 0) {
        return readall();
    }

    if (static_cast<std::size_t>(size) == bufferSize_) {
        checkReadable();
        std::lock_guard<std::mutex> lock(seekMutex_);
        if (!preloaded_) {
            preloadRange();
            preloaded_ = true;
        }
        // A queued chunk starting exactly here is handed over without a copy
        const auto it = readQueue_.find(seek_);
        if (seek_ < size_ && it != readQueue_.end()) {
            static_cast<void>(resolve(it));
            ByteBuffer data = std::move(*it->second.data);
            seek_ += data.size();
            consumed(it);
            return data;
        }
    }
    return ObjectStream::read(size);
}

std::size_t BufferedStream::readinto(MutableByteSpan buffer) {
    checkReadable();
    if (buffer.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(seekMutex_);
    if (!preloaded_) {
        preloadRange();
        preloaded_ = true;
    }

    std::size_t copied = 0;
    while (copied < buffer.size() && seek_ < size_) {
        auto it = chunkAt(seek_);
        if (it == readQueue_.end()) {
            preloadRange();
            it = chunkAt(seek_);
            if (it == readQueue_.end()) {
                break;
            }
        }

        const Offset key = it->first;
        const ByteBuffer& data = resolve(it);
        const std::size_t inChunk = seek_ - key;
        if (inChunk >= data.size()) {
            // Short chunk: end of the object
            break;
        }

        const std::size_t count = std::min(data.size() - inChunk, buffer.size() - copied);
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(inChunk), count,
                    buffer.begin() + static_cast<std::ptrdiff_t>(copied));
        copied += count;
        seek_ += count;

        if (inChunk + count == data.size()) {
            const bool shortChunk = data.size() < bufferSize_;
            consumed(it);
            if (shortChunk) {
                break;
            }
        }
    }
    return copied;
}

ByteBuffer BufferedStream::readall() {
    checkReadable();

    std::size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(seekMutex_);
        remaining = (size_ > seek_) ? static_cast<std::size_t>(size_ - seek_) : 0;
    }

    ByteBuffer data(remaining);
    std::size_t total = 0;
    while (total < data.size()) {
        const std::size_t count = readinto(MutableByteSpan(data).subspan(total));
        if (count == 0) {
            break;
        }
        total += count;
    }
    data.resize(total);
    return data;
}

ByteBuffer BufferedStream::peek(std::int64_t size) {
    checkReadable();
    std::lock_guard<std::mutex> lock(seekMutex_);
    raw_->seek(static_cast<std::int64_t>(seek_), Whence::kSet);
    return raw_->peek(size);
}

Offset BufferedStream::seek(std::int64_t offset, Whence whence) {
    checkOpen();
    if (writable_) {
        throw UnsupportedOperationError("seek is not supported in write mode", ErrorContext(name_));
    }

    std::lock_guard<std::mutex> lock(seekMutex_);
    // The raw position lags behind buffered reads
    static_cast<void>(raw_->seek(static_cast<std::int64_t>(seek_), Whence::kSet));
    const Offset position = raw_->seek(offset, whence);
    seek_ = position;
    preloadRange();
    preloaded_ = true;
    return position;
}

Offset BufferedStream::tell() const {
    std::lock_guard<std::mutex> lock(seekMutex_);
    return seek_;
}

// =============================================================================
// Write path
// =============================================================================

std::size_t BufferedStream::write(ByteSpan data) {
    checkWritable();

    std::lock_guard<std::mutex> lock(seekMutex_);
    std::size_t offset = 0;
    while (offset < data.size()) {
        // A full buffer is only sent once more data needs room, so an
        // object of exactly one buffer still takes the single-flush path
        if (bufferSeek_ == bufferSize_) {
            waitForSlot();
            flushPart();
        }
        const std::size_t count = std::min(bufferSize_ - bufferSeek_, data.size() - offset);
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), count,
                    writeBuffer_.begin() + static_cast<std::ptrdiff_t>(bufferSeek_));
        bufferSeek_ += count;
        offset += count;
        seek_ += count;
    }
    return data.size();
}

void BufferedStream::waitForSlot() {
    if (maxBuffers_ == 0) {
        return;
    }
    const auto inFlight = [this]() {
        return static_cast<std::size_t>(
            std::count_if(writeFutures_.begin(), writeFutures_.end(), [](const PendingPart& part) {
                return part.result.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
            }));
    };
    if (inFlight() < maxBuffers_) {
        return;
    }
    OBJFS_LOG_TRACE("\"{}\": {} parts in flight, waiting", name_, maxBuffers_);
    while (inFlight() >= maxBuffers_) {
        std::this_thread::sleep_for(kFlushPollInterval);
    }
}

void BufferedStream::flushPart() {
    ++partCount_;
    writeBuffer_.resize(bufferSeek_);
    auto data = std::make_shared<const ByteBuffer>(std::move(writeBuffer_));
    const Offset start = bytesFlushed_;
    bytesFlushed_ += data->size();

    writeBuffer_.assign(bufferSize_, 0);
    bufferSeek_ = 0;

    OBJFS_LOG_DEBUG("\"{}\": submitting part {} ({} bytes at {})", name_, partCount_,
                    data->size(), start);
    submitPart(partCount_, std::move(data), start);
}

void BufferedStream::submitPart(PartNumber number, std::shared_ptr<const ByteBuffer> data,
                                Offset /*start*/) {
    if (!upload_) {
        upload_ = normalizeErrors([&]() { return raw_->backend().startPartUpload(); },
                                  ErrorContext(name_));
    }

    storage::PartUpload* upload = upload_.get();
    auto future = workers().submit([upload, number, data = std::move(data), name = name_]() {
        std::string etag =
            normalizeErrors([&]() { return upload->uploadPart(number, *data); },
                            ErrorContext(name).withPart(number));
        return storage::PartInfo{number, std::move(etag), data->size()};
    });
    writeFutures_.push_back(PendingPart{number, future.share()});
}

std::vector<storage::PartInfo> BufferedStream::waitForParts() {
    std::vector<storage::PartInfo> parts;
    parts.reserve(writeFutures_.size());
    std::exception_ptr firstError;

    // Every part is awaited before reporting, so no task outlives the call
    for (auto& pending : writeFutures_) {
        try {
            parts.push_back(pending.result.get());
        } catch (const std::exception&) {
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }

    std::sort(parts.begin(), parts.end(),
              [](const storage::PartInfo& a, const storage::PartInfo& b) {
                  return a.number < b.number;
              });
    return parts;
}

void BufferedStream::closeWritable() {
    if (!upload_) {
        throw InvalidStateError("Multi-part upload was never started", ErrorContext(name_));
    }
    std::vector<storage::PartInfo> parts;
    try {
        parts = waitForParts();
    } catch (const std::exception& ex) {
        OBJFS_LOG_ERROR("Upload of \"{}\" failed, aborting: {}", name_, ex.what());
        abortUpload();
        throw;
    }

    try {
        normalizeErrors([&]() { upload_->complete(parts); }, ErrorContext(name_));
    } catch (const std::exception& ex) {
        OBJFS_LOG_ERROR("Completing \"{}\" failed, aborting: {}", name_, ex.what());
        abortUpload();
        throw;
    }
    OBJFS_LOG_DEBUG("Completed \"{}\" from {} parts", name_, parts.size());
}

void BufferedStream::abortUpload() noexcept {
    if (!upload_) {
        return;
    }
    try {
        upload_->abort();
    } catch (const std::exception& ex) {
        OBJFS_LOG_ERROR("Aborting upload of \"{}\" failed: {}", name_, ex.what());
    }
}

void BufferedStream::flush() {
    if (!writable_ || closed()) {
        return;
    }

    std::lock_guard<std::mutex> lock(seekMutex_);
    if (bufferSeek_ > 0) {
        waitForSlot();
        flushPart();
    }
    static_cast<void>(waitForParts());
}

void BufferedStream::close() {
    if (markClosed()) {
        return;
    }

    if (writable_) {
        std::lock_guard<std::mutex> lock(seekMutex_);
        if (partCount_ > 0) {
            if (bufferSeek_ > 0) {
                waitForSlot();
                flushPart();
            }
            closeWritable();
        } else if (bufferSeek_ > 0) {
            // Never exceeded one buffer: a single flush, no multi-part upload
            raw_->flushWhole(ByteSpan(writeBuffer_.data(), bufferSeek_));
        }
    } else {
        std::lock_guard<std::mutex> lock(seekMutex_);
        readQueue_.clear();
    }
    raw_->close();
}

}  // namespace objfs::io
