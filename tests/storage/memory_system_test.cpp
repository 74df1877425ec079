// =============================================================================
// objfs - In-Memory Object Store Tests
// =============================================================================

#include "objfs/storage/memory_system.h"

#include <gtest/gtest.h>

#include <memory>

#include "objfs/common/error.h"

namespace objfs::storage {
namespace {

class MemorySystemTest : public ::testing::Test {
protected:
    void SetUp() override { store_ = std::make_shared<MemoryStore>(); }

    std::shared_ptr<MemoryStore> store_;
};

// =============================================================================
// Addressing
// =============================================================================

TEST_F(MemorySystemTest, ClientArgs) {
    MemorySystem system(store_);
    const ClientArgs args = system.getClientArgs("mem://bucket/dir/key.bin");
    EXPECT_EQ(args.locator, "bucket");
    EXPECT_EQ(args.key, "dir/key.bin");
    EXPECT_EQ(args.path, "mem://bucket/dir/key.bin");
    EXPECT_EQ(MemorySystem::storeKey(args), "bucket/dir/key.bin");
    EXPECT_EQ(system.relpath("mem://bucket/dir/key.bin"), "bucket/dir/key.bin");
}

TEST_F(MemorySystemTest, OpenObjectNeedsKey) {
    MemorySystem system(store_);
    EXPECT_THROW(static_cast<void>(system.openObject(system.getClientArgs("mem://bucket"))),
                 InvalidArgumentError);
}

// =============================================================================
// Metadata
// =============================================================================

TEST_F(MemorySystemTest, HeadAndExists) {
    MemorySystem system(store_);
    store_->putObject("bucket/key", toBytes("hello"));

    const auto args = system.getClientArgs("mem://bucket/key");
    EXPECT_EQ(system.getSize(system.head(args)), 5u);
    EXPECT_GT(system.getMtime(system.head(args)), 0);
    EXPECT_EQ(system.exists(args), std::optional<bool>(true));

    const auto missing = system.getClientArgs("mem://bucket/missing");
    EXPECT_THROW(static_cast<void>(system.head(missing)), NotFoundError);
    EXPECT_EQ(system.exists(missing), std::optional<bool>(false));
}

TEST_F(MemorySystemTest, AccessDeniedMapsToPermissionDenied) {
    MemorySystem system(store_);
    store_->putObject("bucket/secret", toBytes("x"));
    store_->setAccessDenied("bucket/secret", true);

    const auto args = system.getClientArgs("mem://bucket/secret");
    EXPECT_THROW(static_cast<void>(system.head(args)), PermissionDeniedError);
    EXPECT_EQ(system.exists(args), std::nullopt);
}

TEST_F(MemorySystemTest, HeaderWithoutSizeIsUnsupported) {
    MemorySystem system(store_);
    EXPECT_THROW(static_cast<void>(system.getSize(Header{})), UnsupportedOperationError);
    EXPECT_THROW(static_cast<void>(system.getSize(Header{{std::string(kContentLength), "x1"}})),
                 BackendError);
}

// =============================================================================
// Parameters and traits
// =============================================================================

TEST_F(MemorySystemTest, TraitsFollowKind) {
    MemorySystem block(store_);
    EXPECT_TRUE(block.traits().multipart);
    EXPECT_FALSE(block.traits().randomWrite);

    MemorySystem page(store_, {{"memory.kind", "page"}, {"memory.max_flush_size", "512"}});
    EXPECT_EQ(page.kind(), ObjectKind::kPage);
    EXPECT_TRUE(page.traits().randomWrite);
    EXPECT_FALSE(page.traits().multipart);
    EXPECT_EQ(page.traits().maxFlushSize, 512u);
}

TEST_F(MemorySystemTest, RejectsUnknownParameters) {
    EXPECT_THROW(static_cast<void>(MemorySystem(store_, {{"memory.colour", "red"}})), InvalidArgumentError);
    EXPECT_THROW(static_cast<void>(MemorySystem(store_, {{"memory.kind", "tape"}})), InvalidArgumentError);
    EXPECT_THROW(static_cast<void>(MemorySystem(store_, {{"memory.min_part_size", "-1"}})), InvalidArgumentError);
}

TEST_F(MemorySystemTest, WithParametersMerges) {
    MemorySystem system(store_, {{"memory.min_part_size", "100"}});
    auto page = system.withParameters({{"memory.kind", "page"}});
    const Parameters merged = page->storageParameters();
    EXPECT_EQ(merged.at("memory.min_part_size"), "100");
    EXPECT_EQ(merged.at("memory.kind"), "page");
    EXPECT_TRUE(page->traits().randomWrite);
}

// =============================================================================
// Store primitives
// =============================================================================

TEST_F(MemorySystemTest, ReadRangeClampsToSize) {
    store_->putObject("b/k", toBytes("0123456789"));
    EXPECT_EQ(toString(store_->readRange("b/k", 2, 5)), "234");
    EXPECT_EQ(toString(store_->readRange("b/k", 8, 20)), "89");
    EXPECT_EQ(toString(store_->readRange("b/k", 4, 0)), "456789");
    EXPECT_TRUE(store_->readRange("b/k", 10, 12).empty());
}

TEST_F(MemorySystemTest, RangeWriteZeroFillsGap) {
    store_->writeRange("b/page", toBytes("ab"), 4, 6);
    const auto data = store_->getObject("b/page");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, (ByteBuffer{0, 0, 0, 0, 'a', 'b'}));
    ASSERT_EQ(store_->rangeWrites().size(), 1u);
    EXPECT_EQ(store_->rangeWrites()[0].start, 4u);
}

TEST_F(MemorySystemTest, MultipartAssemblesByPartNumber) {
    const std::string upload = store_->createUpload("b/multi");
    const std::string second = store_->uploadPart(upload, 2, toBytes("world"));
    const std::string first = store_->uploadPart(upload, 1, toBytes("hello "));
    EXPECT_EQ(first, computeEtag(toBytes("hello ")));
    EXPECT_EQ(store_->pendingUploads(), 1u);

    store_->completeUpload(upload, {{1, first, 6}, {2, second, 5}}, 0);
    EXPECT_EQ(toString(*store_->getObject("b/multi")), "hello world");
    EXPECT_EQ(store_->pendingUploads(), 0u);
    EXPECT_EQ(store_->stats().completes, 1u);
    EXPECT_EQ(store_->stats().partsUploaded, 2u);
}

TEST_F(MemorySystemTest, CompleteRejectsBadParts) {
    const std::string upload = store_->createUpload("b/multi");
    const std::string first = store_->uploadPart(upload, 1, toBytes("aa"));
    const std::string second = store_->uploadPart(upload, 2, toBytes("bb"));

    // Unsorted
    EXPECT_THROW(store_->completeUpload(upload, {{2, second, 2}, {1, first, 2}}, 0), StatusError);
    // Wrong ETag
    EXPECT_THROW(store_->completeUpload(upload, {{1, "bogus", 2}}, 0), StatusError);
    // Non-last part below the minimum
    EXPECT_THROW(store_->completeUpload(upload, {{1, first, 2}, {2, second, 2}}, 5), StatusError);

    EXPECT_FALSE(store_->contains("b/multi"));
    store_->abortUpload(upload);
    EXPECT_EQ(store_->pendingUploads(), 0u);
    EXPECT_EQ(store_->stats().aborts, 1u);
}

TEST_F(MemorySystemTest, HookSeesEvents) {
    std::vector<StoreEventType> events;
    store_->setHook([&events](const StoreEvent& event) { events.push_back(event.type); });
    store_->put("b/k", toBytes("x"));
    static_cast<void>(store_->head("b/k"));
    static_cast<void>(store_->readRange("b/k", 0, 0));
    store_->setHook({});

    EXPECT_EQ(events, (std::vector<StoreEventType>{StoreEventType::kPut, StoreEventType::kHead,
                                                   StoreEventType::kRead}));
}

TEST_F(MemorySystemTest, HookFailureAbortsCall) {
    store_->setHook([](const StoreEvent& event) {
        if (event.type == StoreEventType::kPut) {
            throw StatusError(500, "injected");
        }
    });
    EXPECT_THROW(store_->put("b/k", toBytes("x")), StatusError);
    EXPECT_FALSE(store_->contains("b/k"));
}

}  // namespace
}  // namespace objfs::storage
