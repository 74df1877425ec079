// =============================================================================
// objfs - Storage Registry Implementation
// =============================================================================

#include "objfs/storage/registry.h"

#include <mutex>
#include <utility>

#include <fmt/format.h>

#include "objfs/common/error.h"
#include "objfs/common/logger.h"

namespace objfs::storage {

void StorageRegistry::mount(std::shared_ptr<System> system) {
    if (!system) {
        throw InvalidArgumentError("Cannot mount a null storage system");
    }
    for (auto& root : system->roots()) {
        mount(std::move(root), system);
    }
}

void StorageRegistry::mount(std::string root, std::shared_ptr<System> system) {
    if (!system) {
        throw InvalidArgumentError("Cannot mount a null storage system");
    }
    if (root.empty()) {
        throw InvalidArgumentError("Mount root must not be empty");
    }
    OBJFS_LOG_DEBUG("Mounting {} storage on \"{}\"", system->storageName(), root);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    mounts_[std::move(root)] = std::move(system);
}

bool StorageRegistry::unmount(std::string_view root) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = mounts_.find(root);
    if (it == mounts_.end()) {
        return false;
    }
    mounts_.erase(it);
    return true;
}

std::shared_ptr<System> StorageRegistry::resolve(std::string_view path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const std::shared_ptr<System>* best = nullptr;
    std::size_t bestLength = 0;
    for (const auto& [root, system] : mounts_) {
        if (path.starts_with(root) && (best == nullptr || root.size() > bestLength)) {
            best = &system;
            bestLength = root.size();
        }
    }
    if (best == nullptr) {
        throw NotFoundError(fmt::format("No storage mounted for \"{}\"", path));
    }
    return *best;
}

std::vector<std::string> StorageRegistry::roots() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(mounts_.size());
    for (const auto& entry : mounts_) {
        result.push_back(entry.first);
    }
    return result;
}

}  // namespace objfs::storage
