// =============================================================================
// objfs - Buffered Stream Property Tests
// =============================================================================
// *For any* object, buffer size, prefetch depth and sequence of read sizes,
// buffered reads return the object's bytes contiguously and in order.
//
// *For any* sequence of writes, closing a buffered write stream stores
// exactly the concatenated bytes, through a single flush when the data fits
// one buffer and through an ordered multi-part upload otherwise.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "objfs/io/buffered_stream.h"
#include "objfs/io/random_write_stream.h"
#include "objfs/storage/memory_system.h"

namespace objfs::io::test {

// =============================================================================
// Test Utilities
// =============================================================================

/// @brief Generate object content.
rc::Gen<ByteBuffer> objectContent(int maxSize) {
    return rc::gen::container<ByteBuffer>(rc::gen::inRange(0, maxSize + 1),
                                          rc::gen::arbitrary<std::uint8_t>());
}

StreamConfig makeConfig(std::size_t bufferSize, std::size_t maxBuffers) {
    StreamConfig config;
    config.bufferSize = bufferSize;
    config.maxBuffers = maxBuffers;
    config.maxWorkers = 4;
    return config;
}

// =============================================================================
// Read properties
// =============================================================================

RC_GTEST_PROP(BufferedStreamProperty, ReadsAreContiguousAndOrdered, ()) {
    const ByteBuffer data = *objectContent(2000);
    const auto bufferSize = static_cast<std::size_t>(*rc::gen::inRange(1, 300));
    const auto maxBuffers = static_cast<std::size_t>(*rc::gen::inRange(0, 6));
    const auto readSizes =
        *rc::gen::container<std::vector<int>>(rc::gen::inRange(1, 20), rc::gen::inRange(0, 400));

    auto store = std::make_shared<storage::MemoryStore>();
    store->putObject("bucket/obj", data);
    auto system = std::make_shared<storage::MemorySystem>(store);

    auto raw = std::make_unique<RawStream>(system, "mem://bucket/obj", OpenMode::fromString("rb"));
    BufferedStream stream(std::move(raw), makeConfig(bufferSize, maxBuffers));

    ByteBuffer collected;
    for (int size : readSizes) {
        const ByteBuffer chunk = stream.read(size);
        RC_ASSERT(chunk.size() <= static_cast<std::size_t>(size));
        collected.insert(collected.end(), chunk.begin(), chunk.end());
    }
    const ByteBuffer rest = stream.readall();
    collected.insert(collected.end(), rest.begin(), rest.end());

    RC_ASSERT(collected == data);
    RC_ASSERT(stream.tell() == data.size());
}

RC_GTEST_PROP(BufferedStreamProperty, SeekThenReadMatchesObject, ()) {
    const ByteBuffer data = *objectContent(1500);
    RC_PRE(!data.empty());
    const auto bufferSize = static_cast<std::size_t>(*rc::gen::inRange(1, 200));
    const auto maxBuffers = static_cast<std::size_t>(*rc::gen::inRange(1, 5));
    const auto position = *rc::gen::inRange<std::size_t>(0, data.size());
    const auto length = static_cast<std::size_t>(*rc::gen::inRange(0, 500));

    auto store = std::make_shared<storage::MemoryStore>();
    store->putObject("bucket/obj", data);
    auto system = std::make_shared<storage::MemorySystem>(store);

    auto raw = std::make_unique<RawStream>(system, "mem://bucket/obj", OpenMode::fromString("rb"));
    BufferedStream stream(std::move(raw), makeConfig(bufferSize, maxBuffers));

    RC_ASSERT(stream.seek(static_cast<std::int64_t>(position)) == position);
    const ByteBuffer chunk = stream.read(static_cast<std::int64_t>(length));
    const std::size_t expected = std::min(length, data.size() - position);
    RC_ASSERT(chunk == ByteBuffer(data.begin() + static_cast<std::ptrdiff_t>(position),
                                  data.begin() + static_cast<std::ptrdiff_t>(position + expected)));

    // Window never reaches past the object or beyond maxBuffers entries
    const auto queued = stream.queuedOffsets();
    RC_ASSERT(queued.size() <= maxBuffers);
    for (Offset offset : queued) {
        RC_ASSERT(offset < data.size());
    }
}

// =============================================================================
// Write properties
// =============================================================================

RC_GTEST_PROP(BufferedStreamProperty, MultipartWriteStoresConcatenation, ()) {
    const auto writes = *rc::gen::container<std::vector<ByteBuffer>>(
        rc::gen::inRange(0, 8), objectContent(200));
    const auto bufferSize = static_cast<std::size_t>(*rc::gen::inRange(32, 250));
    const auto maxBuffers = static_cast<std::size_t>(*rc::gen::inRange(0, 4));

    auto store = std::make_shared<storage::MemoryStore>();
    auto system = std::make_shared<storage::MemorySystem>(store);

    ByteBuffer expected;
    {
        auto raw =
            std::make_unique<RawStream>(system, "mem://bucket/out", OpenMode::fromString("wb"));
        BufferedStream stream(std::move(raw), makeConfig(bufferSize, maxBuffers));
        for (const auto& chunk : writes) {
            RC_ASSERT(stream.write(chunk) == chunk.size());
            expected.insert(expected.end(), chunk.begin(), chunk.end());
        }
        stream.close();
    }

    const auto stored = store->getObject("bucket/out");
    RC_ASSERT(stored.has_value());
    RC_ASSERT(*stored == expected);
    RC_ASSERT(store->pendingUploads() == 0u);

    const auto stats = store->stats();
    if (expected.size() <= bufferSize) {
        RC_ASSERT(stats.partsUploaded == 0u);
        RC_ASSERT(stats.completes == 0u);
    } else {
        RC_ASSERT(stats.partsUploaded == (expected.size() + bufferSize - 1) / bufferSize);
        RC_ASSERT(stats.completes == 1u);
    }
}

RC_GTEST_PROP(BufferedStreamProperty, RangeWriteStoresConcatenation, ()) {
    const auto writes = *rc::gen::container<std::vector<ByteBuffer>>(
        rc::gen::inRange(0, 8), objectContent(200));
    const auto bufferSize = static_cast<std::size_t>(*rc::gen::inRange(32, 250));

    auto store = std::make_shared<storage::MemoryStore>();
    auto system = std::make_shared<storage::MemorySystem>(
        store, Parameters{{"memory.kind", "page"}});

    ByteBuffer expected;
    {
        auto raw = std::make_unique<RandomWriteRaw>(system, "mem://bucket/page",
                                                    OpenMode::fromString("wb"));
        RandomWriteBuffered stream(std::move(raw), makeConfig(bufferSize, 0));
        for (const auto& chunk : writes) {
            static_cast<void>(stream.write(chunk));
            expected.insert(expected.end(), chunk.begin(), chunk.end());
        }
        stream.close();
    }

    const auto stored = store->getObject("bucket/page");
    RC_ASSERT(stored.has_value());
    RC_ASSERT(*stored == expected);
}

RC_GTEST_PROP(BufferedStreamProperty, WrittenBytesReadBackAtAnyBufferSize, ()) {
    const auto bufferSize = static_cast<std::size_t>(*rc::gen::inRange(2, 120));
    const auto fullBuffers = static_cast<std::size_t>(*rc::gen::inRange(0, 6));
    const auto remainder = static_cast<std::size_t>(*rc::gen::inRange<std::size_t>(0, bufferSize));
    const ByteBuffer data = *rc::gen::container<ByteBuffer>(fullBuffers * bufferSize + remainder,
                                                            rc::gen::arbitrary<std::uint8_t>());

    auto store = std::make_shared<storage::MemoryStore>();
    auto system = std::make_shared<storage::MemorySystem>(store);
    {
        auto raw =
            std::make_unique<RawStream>(system, "mem://bucket/obj", OpenMode::fromString("wb"));
        BufferedStream writer(std::move(raw), makeConfig(bufferSize, 2));
        static_cast<void>(writer.write(data));
        writer.close();
    }

    for (std::size_t readBuffer :
         {std::max<std::size_t>(1, bufferSize / 2), bufferSize, 2 * bufferSize, data.size() + 1}) {
        auto raw =
            std::make_unique<RawStream>(system, "mem://bucket/obj", OpenMode::fromString("rb"));
        BufferedStream reader(std::move(raw), makeConfig(readBuffer, 0));
        RC_ASSERT(reader.readall() == data);
    }
}

RC_GTEST_PROP(RawStreamProperty, TellTracksWrittenBytes, ()) {
    const auto writes = *rc::gen::container<std::vector<ByteBuffer>>(
        rc::gen::inRange(0, 10), objectContent(100));

    auto store = std::make_shared<storage::MemoryStore>();
    auto system = std::make_shared<storage::MemorySystem>(store);

    ByteBuffer expected;
    {
        RawStream writer(system, "mem://bucket/raw", OpenMode::fromString("wb"));
        for (const auto& chunk : writes) {
            static_cast<void>(writer.write(chunk));
            expected.insert(expected.end(), chunk.begin(), chunk.end());
            RC_ASSERT(writer.tell() == expected.size());
        }
        writer.close();
    }

    RawStream reader(system, "mem://bucket/raw", OpenMode::fromString("rb"));
    RC_ASSERT(reader.seek(0) == 0u);
    RC_ASSERT(reader.readall() == expected);
}

}  // namespace objfs::io::test
