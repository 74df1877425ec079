// =============================================================================
// objfs - Storage Registry
// =============================================================================
// Explicit mount table mapping path roots to storage systems. Callers own
// the registry and pass it to open(); there is no process-wide state.
//
// Resolution picks the longest mounted root that prefixes the path, so
// "file://" wins over "/" for file URLs and "mem://" never falls through
// to the local filesystem.
// =============================================================================

#ifndef OBJFS_STORAGE_REGISTRY_H
#define OBJFS_STORAGE_REGISTRY_H

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "objfs/storage/system.h"

namespace objfs::storage {

class StorageRegistry {
public:
    StorageRegistry() = default;

    StorageRegistry(const StorageRegistry&) = delete;
    StorageRegistry& operator=(const StorageRegistry&) = delete;

    /// @brief Mount a system under every root it declares.
    /// @note Replaces systems previously mounted on the same roots.
    void mount(std::shared_ptr<System> system);

    /// @brief Mount a system under an explicit root.
    void mount(std::string root, std::shared_ptr<System> system);

    /// @brief Remove a mount point.
    /// @return true if the root was mounted.
    bool unmount(std::string_view root);

    /// @brief System handling a path.
    /// @throws NotFoundError if no mounted root matches.
    [[nodiscard]] std::shared_ptr<System> resolve(std::string_view path) const;

    [[nodiscard]] std::vector<std::string> roots() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<System>, std::less<>> mounts_;
};

}  // namespace objfs::storage

#endif  // OBJFS_STORAGE_REGISTRY_H
