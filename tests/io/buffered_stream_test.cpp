// =============================================================================
// objfs - Buffered Object Stream Tests
// =============================================================================
// Prefetch window, chunk-ordered reads, multi-part writes, backpressure and
// failure handling against the in-memory store.
// =============================================================================

#include "objfs/io/buffered_stream.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "objfs/common/error.h"
#include "objfs/storage/memory_system.h"

namespace objfs::io {
namespace {

using storage::MemoryStore;
using storage::MemorySystem;
using storage::StoreEvent;
using storage::StoreEventType;

ByteBuffer pattern(std::size_t size) {
    ByteBuffer data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 7 + i / 251) & 0xFF);
    }
    return data;
}

class BufferedStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryStore>();
        system_ = std::make_shared<MemorySystem>(store_);
    }

    std::unique_ptr<BufferedStream> open(const std::string& key, const std::string& mode,
                                         std::size_t bufferSize, std::size_t maxBuffers = 0,
                                         std::shared_ptr<MemorySystem> system = nullptr) {
        StreamConfig config;
        config.bufferSize = bufferSize;
        config.maxBuffers = maxBuffers;
        config.maxWorkers = 4;
        auto raw = std::make_unique<RawStream>(system ? system : system_, "mem://bucket/" + key,
                                               OpenMode::fromString(mode));
        return std::make_unique<BufferedStream>(std::move(raw), config);
    }

    std::shared_ptr<MemoryStore> store_;
    std::shared_ptr<MemorySystem> system_;
};

// =============================================================================
// Read path
// =============================================================================

TEST_F(BufferedStreamTest, ReadsWholeObjectInOrder) {
    const ByteBuffer data = pattern(1000);
    store_->putObject("bucket/obj", data);

    auto stream = open("obj", "rb", 64, 4);
    EXPECT_EQ(stream->readall(), data);
    EXPECT_TRUE(stream->read(10).empty());
}

TEST_F(BufferedStreamTest, UnalignedReadsAreContiguous) {
    const ByteBuffer data = pattern(500);
    store_->putObject("bucket/obj", data);

    auto stream = open("obj", "rb", 64, 3);
    ByteBuffer collected;
    for (std::size_t step : {1u, 63u, 65u, 7u, 200u, 500u}) {
        const ByteBuffer chunk = stream->read(static_cast<std::int64_t>(step));
        collected.insert(collected.end(), chunk.begin(), chunk.end());
    }
    EXPECT_EQ(collected, data);
    EXPECT_EQ(stream->tell(), 500u);
}

TEST_F(BufferedStreamTest, FullBufferReadsHandOverChunks) {
    const ByteBuffer data = pattern(256 + 10);
    store_->putObject("bucket/obj", data);

    auto stream = open("obj", "rb", 128, 2);
    const ByteBuffer first = stream->read(128);
    const ByteBuffer second = stream->read(128);
    const ByteBuffer third = stream->read(128);
    EXPECT_EQ(first, ByteBuffer(data.begin(), data.begin() + 128));
    EXPECT_EQ(second, ByteBuffer(data.begin() + 128, data.begin() + 256));
    EXPECT_EQ(third, ByteBuffer(data.begin() + 256, data.end()));
    EXPECT_TRUE(stream->read(128).empty());
}

TEST_F(BufferedStreamTest, PrefetchWindowFollowsSeek) {
    store_->putObject("bucket/obj", pattern(1000));
    auto stream = open("obj", "rb", 100, 3);

    static_cast<void>(stream->read(1));
    EXPECT_EQ(stream->queuedOffsets(), (std::vector<Offset>{0, 100, 200}));

    static_cast<void>(stream->seek(500));
    EXPECT_EQ(stream->queuedOffsets(), (std::vector<Offset>{500, 600, 700}));

    // Window truncated at the object size
    static_cast<void>(stream->seek(850));
    EXPECT_EQ(stream->queuedOffsets(), (std::vector<Offset>{850, 950}));
}

TEST_F(BufferedStreamTest, ConsumedChunkRefillsWindow) {
    store_->putObject("bucket/obj", pattern(1000));
    auto stream = open("obj", "rb", 100, 2);

    static_cast<void>(stream->read(100));
    EXPECT_EQ(stream->queuedOffsets(), (std::vector<Offset>{100, 200}));
    static_cast<void>(stream->read(150));
    EXPECT_EQ(stream->queuedOffsets(), (std::vector<Offset>{200, 300}));
}

TEST_F(BufferedStreamTest, SeekThenReadReturnsCorrectBytes) {
    const ByteBuffer data = pattern(1000);
    store_->putObject("bucket/obj", data);
    auto stream = open("obj", "rb", 64, 4);

    static_cast<void>(stream->read(10));
    EXPECT_EQ(stream->seek(-100, Whence::kEnd), 900u);
    EXPECT_EQ(stream->read(50), ByteBuffer(data.begin() + 900, data.begin() + 950));
    EXPECT_EQ(stream->seek(-850, Whence::kCur), 100u);
    EXPECT_EQ(stream->read(30), ByteBuffer(data.begin() + 100, data.begin() + 130));
}

TEST_F(BufferedStreamTest, ReadIntoCallerBuffer) {
    const ByteBuffer data = pattern(300);
    store_->putObject("bucket/obj", data);
    auto stream = open("obj", "rb", 64, 2);

    ByteBuffer target(120);
    EXPECT_EQ(stream->readinto(target), 120u);
    EXPECT_EQ(target, ByteBuffer(data.begin(), data.begin() + 120));
}

TEST_F(BufferedStreamTest, ShortReadAtEndOfObject) {
    const ByteBuffer data = pattern(200);
    store_->putObject("bucket/obj", data);
    auto stream = open("obj", "rb", 64, 2);

    static_cast<void>(stream->seek(190));
    ByteBuffer target(50);
    EXPECT_EQ(stream->readinto(target), 10u);
    EXPECT_EQ(ByteBuffer(target.begin(), target.begin() + 10),
              ByteBuffer(data.begin() + 190, data.end()));
    EXPECT_EQ(stream->readinto(target), 0u);
}

TEST_F(BufferedStreamTest, PeekDoesNotMovePosition) {
    store_->putObject("bucket/obj", toBytes("0123456789"));
    auto stream = open("obj", "rb", 4, 2);
    static_cast<void>(stream->read(3));
    EXPECT_EQ(toString(stream->peek(4)), "3456");
    EXPECT_EQ(stream->tell(), 3u);
    EXPECT_EQ(toString(stream->read(2)), "34");
}

TEST_F(BufferedStreamTest, DefaultMaxBuffersCoversObject) {
    store_->putObject("bucket/obj", pattern(1001));
    auto stream = open("obj", "rb", 100);
    EXPECT_EQ(stream->maxBuffers(), 11u);
}

TEST_F(BufferedStreamTest, EmptyObject) {
    store_->putObject("bucket/empty", ByteBuffer{});
    auto stream = open("empty", "rb", 16, 2);
    EXPECT_TRUE(stream->readall().empty());
    EXPECT_TRUE(stream->queuedOffsets().empty());
}

TEST_F(BufferedStreamTest, ChunkFailureSurfacesWhenConsumed) {
    const ByteBuffer data = pattern(300);
    store_->putObject("bucket/obj", data);
    store_->setHook([](const StoreEvent& event) {
        if (event.type == StoreEventType::kRead && event.start == 100) {
            throw StatusError(500, "injected read failure");
        }
    });

    auto stream = open("obj", "rb", 100, 3);
    // Bytes before the failed chunk are delivered
    EXPECT_EQ(stream->read(100), ByteBuffer(data.begin(), data.begin() + 100));
    EXPECT_THROW(static_cast<void>(stream->read(100)), StatusError);
    store_->setHook({});
}

TEST_F(BufferedStreamTest, MissingChunkMapsToNotFound) {
    store_->putObject("bucket/obj", pattern(300));
    auto stream = open("obj", "rb", 100, 1);
    store_->removeObject("bucket/obj");
    EXPECT_THROW(static_cast<void>(stream->read(10)), NotFoundError);
}

// =============================================================================
// Write path
// =============================================================================

TEST_F(BufferedStreamTest, SmallObjectUsesSingleFlush) {
    auto stream = open("small", "wb", 100);
    static_cast<void>(stream->write(pattern(60)));
    static_cast<void>(stream->write(pattern(40)));
    stream->close();

    EXPECT_EQ(*store_->getObject("bucket/small"), [] {
        ByteBuffer expected = pattern(60);
        const ByteBuffer tail = pattern(40);
        expected.insert(expected.end(), tail.begin(), tail.end());
        return expected;
    }());
    EXPECT_EQ(store_->stats().partsUploaded, 0u);
    EXPECT_EQ(store_->stats().completes, 0u);
    EXPECT_EQ(store_->pendingUploads(), 0u);
}

TEST_F(BufferedStreamTest, LargeObjectUsesMultipart) {
    const ByteBuffer data = pattern(1050);
    auto stream = open("large", "wb", 100, 3);
    for (std::size_t offset = 0; offset < data.size(); offset += 70) {
        const std::size_t count = std::min<std::size_t>(70, data.size() - offset);
        static_cast<void>(stream->write(ByteSpan(data).subspan(offset, count)));
    }
    stream->close();

    EXPECT_EQ(*store_->getObject("bucket/large"), data);
    EXPECT_EQ(stream->partCount(), 11u);
    EXPECT_EQ(store_->stats().partsUploaded, 11u);
    EXPECT_EQ(store_->stats().completes, 1u);
    EXPECT_EQ(store_->pendingUploads(), 0u);
}

TEST_F(BufferedStreamTest, OutOfOrderPartCompletionAssemblesByNumber) {
    store_->setHook([](const StoreEvent& event) {
        if (event.type == StoreEventType::kUploadPart) {
            // Early parts finish last
            std::this_thread::sleep_for(std::chrono::milliseconds(5 * (8 - event.part)));
        }
    });

    const ByteBuffer data = pattern(750);
    auto stream = open("shuffled", "wb", 100, 0);
    static_cast<void>(stream->write(data));
    stream->close();
    store_->setHook({});

    EXPECT_EQ(*store_->getObject("bucket/shuffled"), data);
    EXPECT_EQ(store_->stats().partsUploaded, 8u);
}

TEST_F(BufferedStreamTest, MaxBuffersBoundsPartsInFlight) {
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};
    store_->setHook([&](const StoreEvent& event) {
        if (event.type != StoreEventType::kUploadPart) {
            return;
        }
        const int now = inFlight.fetch_add(1) + 1;
        int previous = peak.load();
        while (now > previous && !peak.compare_exchange_weak(previous, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        inFlight.fetch_sub(1);
    });

    auto stream = open("bounded", "wb", 50, 1);
    static_cast<void>(stream->write(pattern(400)));
    stream->close();
    store_->setHook({});

    EXPECT_EQ(peak.load(), 1);
    EXPECT_EQ(*store_->getObject("bucket/bounded"), pattern(400));
}

TEST_F(BufferedStreamTest, FailedCompleteAbortsUpload) {
    auto system = std::make_shared<MemorySystem>(
        store_, Parameters{{"memory.min_part_size", "1000"}});
    auto stream = open("tiny-parts", "wb", 100, 2, system);
    static_cast<void>(stream->write(pattern(250)));

    EXPECT_THROW(stream->close(), StatusError);
    EXPECT_EQ(store_->stats().aborts, 1u);
    EXPECT_EQ(store_->stats().completes, 0u);
    EXPECT_EQ(store_->pendingUploads(), 0u);
    EXPECT_EQ(store_->getObject("bucket/tiny-parts")->size(), 0u);
}

TEST_F(BufferedStreamTest, FailedPartAbortsUpload) {
    store_->setHook([](const StoreEvent& event) {
        if (event.type == StoreEventType::kUploadPart && event.part == 2) {
            throw StatusError(500, "injected part failure");
        }
    });

    auto stream = open("broken", "wb", 100, 0);
    static_cast<void>(stream->write(pattern(350)));
    EXPECT_THROW(stream->close(), StatusError);
    store_->setHook({});

    EXPECT_EQ(store_->stats().aborts, 1u);
    EXPECT_EQ(store_->pendingUploads(), 0u);
}

TEST_F(BufferedStreamTest, DeniedPartMapsToPermissionDenied) {
    auto stream = open("denied", "wb", 100, 0);
    store_->setAccessDenied("bucket/denied", true);
    // The first part starts the upload once the buffer overflows
    EXPECT_THROW(static_cast<void>(stream->write(pattern(150))), PermissionDeniedError);
    EXPECT_THROW(stream->close(), ObjfsException);
    store_->setAccessDenied("bucket/denied", false);
}

TEST_F(BufferedStreamTest, WriteModeRestrictions) {
    auto stream = open("obj", "wb", 100);
    EXPECT_FALSE(stream->seekable());
    EXPECT_THROW(stream->seek(0), UnsupportedOperationError);
    EXPECT_THROW(static_cast<void>(stream->read(1)), UnsupportedOperationError);

    static_cast<void>(stream->write(toBytes("abc")));
    EXPECT_EQ(stream->tell(), 3u);
    stream->close();

    EXPECT_THROW(open("obj", "ab", 100), UnsupportedOperationError);
}

TEST_F(BufferedStreamTest, CloseTwiceIsNoOp) {
    auto stream = open("twice", "wb", 100, 2);
    static_cast<void>(stream->write(pattern(250)));
    stream->close();
    const auto stats = store_->stats();

    stream->close();
    const auto after = store_->stats();
    EXPECT_EQ(after.puts, stats.puts);
    EXPECT_EQ(after.partsUploaded, stats.partsUploaded);
    EXPECT_EQ(after.completes, stats.completes);
    EXPECT_TRUE(stream->closed());
    EXPECT_THROW(static_cast<void>(stream->write(toBytes("x"))), InvalidStateError);
}

TEST_F(BufferedStreamTest, DestructorFinalizes) {
    {
        auto stream = open("scoped", "wb", 100, 2);
        static_cast<void>(stream->write(pattern(250)));
    }
    EXPECT_EQ(*store_->getObject("bucket/scoped"), pattern(250));
}

}  // namespace
}  // namespace objfs::io
