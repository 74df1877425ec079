// =============================================================================
// objfs - Raw Object Stream Implementation
// =============================================================================

#include "objfs/io/raw_stream.h"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "objfs/common/logger.h"
#include "objfs/storage/error_mapping.h"

namespace objfs::io {

using storage::normalizeErrors;

// =============================================================================
// Construction
// =============================================================================

RawStream::RawStream(std::shared_ptr<storage::System> system, std::string name, OpenMode mode)
    : RawStream(DeferInit{}, std::move(system), std::move(name), std::move(mode)) {
    initialize();
}

RawStream::RawStream(DeferInit, std::shared_ptr<storage::System> system, std::string name,
                     OpenMode mode)
    : ObjectStream(std::move(name), std::move(mode)), system_(std::move(system)) {
    if (!system_) {
        throw InvalidArgumentError("Stream requires a storage system", context());
    }
    clientArgs_ = system_->getClientArgs(name_);
    traits_ = system_->traits();
    backend_ = system_->openObject(clientArgs_);
}

RawStream::~RawStream() {
    try {
        close();
    } catch (const std::exception& ex) {
        OBJFS_LOG_ERROR("Closing \"{}\" failed: {}", name_, ex.what());
    }
}

void RawStream::initialize() {
    if (!writable_) {
        static_cast<void>(header());
        OBJFS_LOG_DEBUG("Opened \"{}\" for reading", name_);
        return;
    }

    switch (mode_.access) {
        case AccessMode::kAppend: {
            const auto found = exists();
            if (!found.has_value()) {
                throw PermissionDeniedError(
                    "Insufficient permission to check if the object already exists", context());
            }
            if (*found) {
                initAppend();
            } else {
                create();
            }
            break;
        }
        case AccessMode::kExclusive: {
            const auto found = exists();
            if (!found.has_value()) {
                throw PermissionDeniedError(
                    "Insufficient permission to check if the object already exists", context());
            }
            if (*found) {
                throw AlreadyExistsError("Object already exists", context());
            }
            create();
            break;
        }
        case AccessMode::kWrite:
        case AccessMode::kRead:
            create();
            break;
    }
    OBJFS_LOG_DEBUG("Opened \"{}\" for writing (mode \"{}\")", name_, mode_.text);
}

void RawStream::initAppend() {
    std::lock_guard<std::mutex> lock(seekMutex_);
    buffer_ = normalizeErrors([&]() { return backend_->readAll(); }, context());
    bufferOffset_ = 0;
    seek_ = buffer_.size();
}

void RawStream::create() {
    normalizeErrors([&]() { backend_->create(); }, context());
    resetHeader();
}

// =============================================================================
// Metadata
// =============================================================================

storage::Header RawStream::header() {
    std::lock_guard<std::mutex> lock(headerMutex_);
    if (!header_.has_value()) {
        header_ = system_->head(clientArgs_);
    }
    return *header_;
}

void RawStream::resetHeader() {
    std::lock_guard<std::mutex> lock(headerMutex_);
    header_.reset();
}

Offset RawStream::size() {
    std::lock_guard<std::mutex> lock(seekMutex_);
    return currentSize();
}

Offset RawStream::currentSize() {
    if (readable_) {
        return system_->getSize(header());
    }
    return bufferOffset_ + buffer_.size();
}

std::int64_t RawStream::mtime() {
    return system_->getMtime(header());
}

std::optional<bool> RawStream::exists() {
    try {
        static_cast<void>(header());
        return true;
    } catch (const NotFoundError&) {
        return false;
    } catch (const PermissionDeniedError&) {
        return std::nullopt;
    }
}

Offset RawStream::remoteSize() {
    resetHeader();
    return system_->getSize(header());
}

// =============================================================================
// Backend primitives
// =============================================================================

ByteBuffer RawStream::readRange(Offset start, Offset end) {
    return normalizeErrors([&]() { return backend_->readRange(start, end); },
                           ErrorContext(name_).withOffset(start));
}

void RawStream::writeRange(ByteSpan data, Offset start) {
    const std::size_t limit = traits_.maxFlushSize;
    if (limit == 0 || data.size() <= limit) {
        normalizeErrors([&]() { backend_->flushRange(data, start, start + data.size()); },
                        ErrorContext(name_).withOffset(start));
        return;
    }

    for (std::size_t offset = 0; offset < data.size(); offset += limit) {
        const ByteSpan piece = data.subspan(offset, std::min(limit, data.size() - offset));
        const Offset pieceStart = start + offset;
        normalizeErrors(
            [&]() { backend_->flushRange(piece, pieceStart, pieceStart + piece.size()); },
            ErrorContext(name_).withOffset(pieceStart));
    }
}

void RawStream::flushBuffer() {
    normalizeErrors([&]() { backend_->flush(buffer_); }, context());
}

void RawStream::flushWhole(ByteSpan data) {
    std::lock_guard<std::mutex> lock(seekMutex_);
    buffer_.assign(data.begin(), data.end());
    bufferOffset_ = 0;
    seek_ = buffer_.size();
    flushBuffer();
    dirty_ = false;
}

// =============================================================================
// Reading
// =============================================================================

std::size_t RawStream::readinto(MutableByteSpan buffer) {
    checkReadable();
    if (buffer.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(seekMutex_);
    const Offset start = seek_;
    const ByteBuffer data = readRange(start, start + buffer.size());
    const std::size_t count = std::min(data.size(), buffer.size());
    std::copy_n(data.begin(), count, buffer.begin());
    seek_ = start + count;
    return count;
}

ByteBuffer RawStream::readall() {
    checkReadable();

    std::lock_guard<std::mutex> lock(seekMutex_);
    ByteBuffer data = (seek_ > 0)
                          ? readRange(seek_, 0)
                          : normalizeErrors([&]() { return backend_->readAll(); }, context());
    seek_ += data.size();
    return data;
}

ByteBuffer RawStream::peek(std::int64_t size) {
    checkReadable();

    std::lock_guard<std::mutex> lock(seekMutex_);
    if (size == 0) {
        return {};
    }
    if (size < 0) {
        return readRange(seek_, 0);
    }
    return readRange(seek_, seek_ + static_cast<Offset>(size));
}

// =============================================================================
// Writing and positioning
// =============================================================================

std::size_t RawStream::write(ByteSpan data) {
    checkWritable();
    if (data.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(seekMutex_);
    const std::size_t position = seek_ - bufferOffset_;
    const std::size_t end = position + data.size();
    if (end > buffer_.size()) {
        buffer_.resize(end, 0);
    }
    std::copy(data.begin(), data.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(position));
    seek_ += data.size();
    dirty_ = true;
    return data.size();
}

Offset RawStream::updateSeek(std::int64_t offset, Whence whence) {
    std::int64_t base = 0;
    switch (whence) {
        case Whence::kSet:
            base = 0;
            break;
        case Whence::kCur:
            base = static_cast<std::int64_t>(seek_);
            break;
        case Whence::kEnd:
            base = static_cast<std::int64_t>(currentSize());
            break;
    }
    const std::int64_t target = base + offset;
    if (target < 0) {
        throw InvalidArgumentError(fmt::format("Negative seek position {}", target), context());
    }
    seek_ = static_cast<Offset>(target);
    return seek_;
}

Offset RawStream::seek(std::int64_t offset, Whence whence) {
    checkOpen();
    if (!seekable_) {
        throw UnsupportedOperationError("seek", context());
    }

    std::lock_guard<std::mutex> lock(seekMutex_);
    const Offset position = updateSeek(offset, whence);
    if (writable_ && position > bufferOffset_ + buffer_.size()) {
        // Sparse write: the gap reads back as zeros
        buffer_.resize(position - bufferOffset_, 0);
        dirty_ = true;
    }
    return position;
}

void RawStream::flush() {
    if (!writable_) {
        return;
    }
    std::lock_guard<std::mutex> lock(seekMutex_);
    if (!dirty_) {
        return;
    }
    flushBuffer();
    dirty_ = false;
}

void RawStream::close() {
    if (markClosed()) {
        return;
    }
    if (writable_ && !ownedByBuffered_) {
        std::lock_guard<std::mutex> lock(seekMutex_);
        if (dirty_) {
            flushBuffer();
            dirty_ = false;
        }
    }
    OBJFS_LOG_DEBUG("Closed \"{}\"", name_);
}

}  // namespace objfs::io
