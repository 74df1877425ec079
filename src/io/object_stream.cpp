// =============================================================================
// objfs - Object Stream Interface Implementation
// =============================================================================

#include "objfs/io/object_stream.h"

#include <utility>

#include <fmt/format.h>

#include "objfs/common/error.h"

namespace objfs::io {

ObjectStream::ObjectStream(std::string name, OpenMode mode)
    : name_(std::move(name)),
      mode_(std::move(mode)),
      readable_(mode_.readable()),
      writable_(mode_.writable()) {}

ByteBuffer ObjectStream::read(std::int64_t size) {
    if (size < 0) {
        return readall();
    }
    ByteBuffer data(static_cast<std::size_t>(size));
    const std::size_t count = readinto(data);
    data.resize(count);
    return data;
}

Offset ObjectStream::tell() const {
    if (!seekable_) {
        throw UnsupportedOperationError("tell", ErrorContext(name_));
    }
    std::lock_guard<std::mutex> lock(seekMutex_);
    return seek_;
}

void ObjectStream::checkOpen() const {
    if (closed()) {
        throw InvalidStateError("I/O operation on closed stream", ErrorContext(name_));
    }
}

void ObjectStream::checkReadable() const {
    checkOpen();
    if (!readable_) {
        throw UnsupportedOperationError(fmt::format("read (stream opened with mode \"{}\")",
                                                    mode_.text),
                                        ErrorContext(name_));
    }
}

void ObjectStream::checkWritable() const {
    checkOpen();
    if (!writable_) {
        throw UnsupportedOperationError(fmt::format("write (stream opened with mode \"{}\")",
                                                    mode_.text),
                                        ErrorContext(name_));
    }
}

}  // namespace objfs::io
