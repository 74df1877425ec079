// =============================================================================
// objfs - In-Memory Object Store
// =============================================================================
// An in-process object store with two object kinds:
//
// - kBlock: S3-like. Whole-object puts and multi-part uploads; complete()
//   assembles parts strictly by part number.
// - kPage:  Azure page-blob-like. Range writes update the object in place,
//   zero-filling any gap past the current end.
//
// The store keeps call statistics, the landing order of range writes and
// a hook invoked before every backend event. Tests use the hook to inject
// delays (out-of-order completion) and failures.
//
// Paths: mem://<locator>/<key>
//
// Parameters:
//   memory.kind            "block" (default) or "page"
//   memory.min_part_size   minimum size of every part but the last
//   memory.max_flush_size  largest single range write (page kind)
// =============================================================================

#ifndef OBJFS_STORAGE_MEMORY_SYSTEM_H
#define OBJFS_STORAGE_MEMORY_SYSTEM_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "objfs/common/types.h"
#include "objfs/storage/system.h"

namespace objfs::storage {

// =============================================================================
// Store Events and Statistics
// =============================================================================

enum class ObjectKind : std::uint8_t {
    kBlock = 0,
    kPage
};

enum class StoreEventType : std::uint8_t {
    kHead = 0,
    kRead,
    kPut,
    kUploadPart,
    kComplete,
    kAbort,
    kRangeWrite
};

/// @brief Backend event passed to the store hook.
struct StoreEvent {
    StoreEventType type = StoreEventType::kHead;
    std::string key;
    Offset start = 0;
    Offset end = 0;
    PartNumber part = 0;
};

/// @brief Call counters.
struct StoreStats {
    std::size_t heads = 0;
    std::size_t reads = 0;
    std::size_t puts = 0;
    std::size_t partsUploaded = 0;
    std::size_t completes = 0;
    std::size_t aborts = 0;
    std::size_t rangeWrites = 0;
};

/// @brief One landed range write.
struct RangeWrite {
    std::string key;
    Offset start = 0;
    Offset end = 0;
};

// =============================================================================
// MemoryStore
// =============================================================================

/// @brief Thread-safe in-memory object store shared by MemorySystem instances.
class MemoryStore {
public:
    using Hook = std::function<void(const StoreEvent&)>;

    MemoryStore() = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    // -------------------------------------------------------------------------
    // Direct access (test setup and inspection)
    // -------------------------------------------------------------------------

    void putObject(const std::string& key, ByteSpan data);
    [[nodiscard]] std::optional<ByteBuffer> getObject(const std::string& key) const;
    [[nodiscard]] bool contains(const std::string& key) const;
    void removeObject(const std::string& key);

    /// @brief Make head/read/write calls on a key fail with status 403.
    void setAccessDenied(const std::string& key, bool denied);

    /// @brief Install the event hook; called outside the store lock.
    void setHook(Hook hook);

    [[nodiscard]] StoreStats stats() const;
    [[nodiscard]] std::vector<RangeWrite> rangeWrites() const;
    [[nodiscard]] std::size_t pendingUploads() const;
    void resetStats();

    // -------------------------------------------------------------------------
    // Backend primitives (throw StatusError)
    // -------------------------------------------------------------------------

    [[nodiscard]] Header head(const std::string& key);
    [[nodiscard]] ByteBuffer readRange(const std::string& key, Offset start, Offset end);
    void put(const std::string& key, ByteSpan data);
    void writeRange(const std::string& key, ByteSpan data, Offset start, Offset end);

    [[nodiscard]] std::string createUpload(const std::string& key);
    [[nodiscard]] std::string uploadPart(const std::string& uploadId, PartNumber number,
                                         ByteSpan data);
    void completeUpload(const std::string& uploadId, const std::vector<PartInfo>& parts,
                        std::size_t minPartSize);
    void abortUpload(const std::string& uploadId);

private:
    struct StoredObject {
        ByteBuffer data;
        std::int64_t modified = 0;
    };

    struct Upload {
        std::string key;
        std::map<PartNumber, ByteBuffer> parts;
    };

    void notify(const StoreEvent& event);
    void checkAccess(const std::string& key) const;

    mutable std::mutex mutex_;
    std::map<std::string, StoredObject> objects_;
    std::map<std::string, Upload> uploads_;
    std::set<std::string> denied_;
    std::uint64_t nextUploadId_ = 1;
    StoreStats stats_;
    std::vector<RangeWrite> rangeWrites_;
    Hook hook_;
};

/// @brief ETag of a part: hex XXH64 of its bytes.
[[nodiscard]] std::string computeEtag(ByteSpan data);

// =============================================================================
// MemorySystem
// =============================================================================

class MemorySystem : public System {
public:
    static constexpr std::string_view kRoot = "mem://";

    explicit MemorySystem(std::shared_ptr<MemoryStore> store, Parameters parameters = {});

    [[nodiscard]] std::string_view storageName() const noexcept override { return "memory"; }
    [[nodiscard]] std::vector<std::string> roots() const override;
    [[nodiscard]] ClientArgs getClientArgs(std::string_view path) const override;
    [[nodiscard]] std::unique_ptr<ObjectBackend> openObject(const ClientArgs& args) override;
    [[nodiscard]] BackendTraits traits() const override;
    [[nodiscard]] Parameters storageParameters() const override { return parameters_; }
    [[nodiscard]] std::shared_ptr<System> withParameters(
        const Parameters& parameters) const override;

    [[nodiscard]] ObjectKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::shared_ptr<MemoryStore>& store() const noexcept { return store_; }

    /// @brief Store key ("locator/key") of a path.
    [[nodiscard]] static std::string storeKey(const ClientArgs& args);

protected:
    [[nodiscard]] Header headObject(const ClientArgs& args) override;

private:
    std::shared_ptr<MemoryStore> store_;
    Parameters parameters_;
    ObjectKind kind_ = ObjectKind::kBlock;
    std::size_t minPartSize_ = 0;
    std::size_t maxFlushSize_ = 0;
};

}  // namespace objfs::storage

#endif  // OBJFS_STORAGE_MEMORY_SYSTEM_H
