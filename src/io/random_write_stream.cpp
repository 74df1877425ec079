// =============================================================================
// objfs - Random-Write Object Streams Implementation
// =============================================================================

#include "objfs/io/random_write_stream.h"

#include <algorithm>
#include <thread>
#include <utility>

#include "objfs/common/error.h"
#include "objfs/common/logger.h"

namespace objfs::io {

// =============================================================================
// RandomWriteRaw
// =============================================================================

RandomWriteRaw::RandomWriteRaw(std::shared_ptr<storage::System> system, std::string name,
                               OpenMode mode)
    : RawStream(DeferInit{}, std::move(system), std::move(name), std::move(mode)) {
    initialize();
}

RandomWriteRaw::~RandomWriteRaw() {
    // Close here so the range flush, not the whole-object flush, runs
    try {
        close();
    } catch (const std::exception& ex) {
        OBJFS_LOG_ERROR("Closing \"{}\" failed: {}", name_, ex.what());
    }
}

void RandomWriteRaw::initAppend() {
    const Offset size = system_->getSize(header());
    std::lock_guard<std::mutex> lock(seekMutex_);
    knownSize_ = size;
    seek_ = size;
    bufferOffset_ = size;
    buffer_.clear();
}

void RandomWriteRaw::create() {
    RawStream::create();
    std::lock_guard<std::mutex> lock(seekMutex_);
    knownSize_ = 0;
}

void RandomWriteRaw::flushBuffer() {
    if (!buffer_.empty()) {
        writeRange(buffer_, bufferOffset_);
        knownSize_ = std::max(knownSize_, bufferOffset_ + buffer_.size());
        buffer_.clear();
    }
    bufferOffset_ = seek_;
}

Offset RandomWriteRaw::currentSize() {
    if (readable_) {
        return RawStream::currentSize();
    }
    return std::max(knownSize_, bufferOffset_ + buffer_.size());
}

Offset RandomWriteRaw::seek(std::int64_t offset, Whence whence) {
    checkOpen();
    if (!seekable_) {
        throw UnsupportedOperationError("seek", context());
    }

    std::lock_guard<std::mutex> lock(seekMutex_);
    if (writable_ && dirty_) {
        flushBuffer();
        dirty_ = false;
    }
    const Offset position = updateSeek(offset, whence);
    if (writable_) {
        bufferOffset_ = position;
    }
    return position;
}

// =============================================================================
// RangeSizeTracker
// =============================================================================

void RangeSizeTracker::synchronize(const std::function<Offset()>& fetchSize) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (synchronized_) {
        return;
    }
    try {
        size_ = fetchSize();
    } catch (const NotFoundError&) {
        size_ = 0;
    } catch (const UnsupportedOperationError&) {
        size_ = 0;
    }
    synchronized_ = true;
}

void RangeSizeTracker::waitUntilReachable(Offset start) const {
    while (true) {
        if (failed_.load(std::memory_order_acquire)) {
            throw BackendError("An earlier range write of this object failed");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (start <= size_) {
                return;
            }
        }
        std::this_thread::sleep_for(kFlushPollInterval);
    }
}

void RangeSizeTracker::update(Offset end) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_ = std::max(size_, end);
}

Offset RangeSizeTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

// =============================================================================
// RandomWriteBuffered
// =============================================================================

RandomWriteBuffered::RandomWriteBuffered(std::unique_ptr<RandomWriteRaw> raw,
                                         const StreamConfig& config)
    : BufferedStream(std::move(raw), config) {}

RandomWriteBuffered::~RandomWriteBuffered() {
    try {
        close();
    } catch (const std::exception& ex) {
        OBJFS_LOG_ERROR("Closing \"{}\" failed: {}", name_, ex.what());
    }
    // Pool tasks reference tracker_
    resetPool();
}

void RandomWriteBuffered::submitPart(PartNumber number, std::shared_ptr<const ByteBuffer> data,
                                     Offset start) {
    RawStream* raw = raw_.get();
    RangeSizeTracker* tracker = &tracker_;
    auto future = workers().submit([raw, tracker, number, data = std::move(data), start]() {
        try {
            tracker->synchronize([raw]() { return raw->remoteSize(); });
            tracker->waitUntilReachable(start);
            raw->writeRange(*data, start);
        } catch (const std::exception&) {
            tracker->markFailed();
            throw;
        }
        tracker->update(start + data->size());
        return storage::PartInfo{number, std::string(), data->size()};
    });
    writeFutures_.push_back(PendingPart{number, future.share()});
}

void RandomWriteBuffered::closeWritable() {
    const auto parts = waitForParts();
    OBJFS_LOG_DEBUG("\"{}\": {} ranges written, size {}", name_, parts.size(), tracker_.size());
}

}  // namespace objfs::io
