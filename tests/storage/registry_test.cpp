// =============================================================================
// objfs - Storage Registry Tests
// =============================================================================

#include "objfs/storage/registry.h"

#include <gtest/gtest.h>

#include <memory>

#include "objfs/common/error.h"
#include "objfs/storage/local_system.h"
#include "objfs/storage/memory_system.h"

namespace objfs::storage {
namespace {

TEST(StorageRegistryTest, ResolvesByRoot) {
    StorageRegistry registry;
    auto memory = std::make_shared<MemorySystem>(std::make_shared<MemoryStore>());
    auto local = std::make_shared<LocalSystem>();
    registry.mount(memory);
    registry.mount(local);

    EXPECT_EQ(registry.resolve("mem://bucket/key"), memory);
    EXPECT_EQ(registry.resolve("/tmp/file"), local);
    EXPECT_EQ(registry.resolve("file:///tmp/file"), local);
    EXPECT_EQ(registry.roots().size(), 3u);
}

TEST(StorageRegistryTest, LongestRootWins) {
    StorageRegistry registry;
    auto store = std::make_shared<MemoryStore>();
    auto generic = std::make_shared<MemorySystem>(store);
    auto pages = std::make_shared<MemorySystem>(store, Parameters{{"memory.kind", "page"}});
    registry.mount("mem://", generic);
    registry.mount("mem://pages/", pages);

    EXPECT_EQ(registry.resolve("mem://pages/blob"), pages);
    EXPECT_EQ(registry.resolve("mem://blocks/blob"), generic);
}

TEST(StorageRegistryTest, UnknownPathAndUnmount) {
    StorageRegistry registry;
    EXPECT_THROW(static_cast<void>(registry.resolve("s3://bucket/key")), NotFoundError);

    registry.mount(std::make_shared<MemorySystem>(std::make_shared<MemoryStore>()));
    EXPECT_TRUE(registry.unmount("mem://"));
    EXPECT_FALSE(registry.unmount("mem://"));
    EXPECT_THROW(static_cast<void>(registry.resolve("mem://bucket/key")), NotFoundError);
}

TEST(StorageRegistryTest, RejectsInvalidMounts) {
    StorageRegistry registry;
    EXPECT_THROW(registry.mount(nullptr), InvalidArgumentError);
    EXPECT_THROW(registry.mount("", std::make_shared<LocalSystem>()), InvalidArgumentError);
}

}  // namespace
}  // namespace objfs::storage
