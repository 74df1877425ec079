// =============================================================================
// objfs - In-Memory Object Store Implementation
// =============================================================================

#include "objfs/storage/memory_system.h"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <utility>

#include <fmt/format.h>
#include <xxhash.h>

#include "objfs/common/error.h"
#include "objfs/common/logger.h"

namespace objfs::storage {

namespace {

std::int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::size_t parseSize(const std::string& name, const std::string& value) {
    std::size_t result = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        throw InvalidArgumentError(
            fmt::format("Parameter \"{}\" expects a byte count, got \"{}\"", name, value));
    }
    return result;
}

// =============================================================================
// Backend and Part Upload
// =============================================================================

class MemoryPartUpload : public PartUpload {
public:
    MemoryPartUpload(std::shared_ptr<MemoryStore> store, std::string uploadId,
                     std::size_t minPartSize)
        : store_(std::move(store)), uploadId_(std::move(uploadId)), minPartSize_(minPartSize) {}

    std::string uploadPart(PartNumber number, ByteSpan data) override {
        return store_->uploadPart(uploadId_, number, data);
    }

    void complete(const std::vector<PartInfo>& parts) override {
        store_->completeUpload(uploadId_, parts, minPartSize_);
    }

    void abort() override { store_->abortUpload(uploadId_); }

private:
    std::shared_ptr<MemoryStore> store_;
    std::string uploadId_;
    std::size_t minPartSize_;
};

class MemoryBackend : public ObjectBackend {
public:
    MemoryBackend(std::shared_ptr<MemoryStore> store, std::string key, ObjectKind kind,
                  std::size_t minPartSize)
        : store_(std::move(store)), key_(std::move(key)), kind_(kind), minPartSize_(minPartSize) {}

    ByteBuffer readRange(Offset start, Offset end) override {
        return store_->readRange(key_, start, end);
    }

    void flush(ByteSpan data) override { store_->put(key_, data); }

    void flushRange(ByteSpan data, Offset start, Offset end) override {
        if (kind_ != ObjectKind::kPage) {
            ObjectBackend::flushRange(data, start, end);
            return;
        }
        store_->writeRange(key_, data, start, end);
    }

    std::unique_ptr<PartUpload> startPartUpload() override {
        if (kind_ != ObjectKind::kBlock) {
            return ObjectBackend::startPartUpload();
        }
        return std::make_unique<MemoryPartUpload>(store_, store_->createUpload(key_),
                                                  minPartSize_);
    }

private:
    std::shared_ptr<MemoryStore> store_;
    std::string key_;
    ObjectKind kind_;
    std::size_t minPartSize_;
};

}  // namespace

std::string computeEtag(ByteSpan data) {
    return fmt::format("{:016x}", XXH64(data.data(), data.size(), 0));
}

// =============================================================================
// MemoryStore: direct access
// =============================================================================

void MemoryStore::putObject(const std::string& key, ByteSpan data) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] = StoredObject{ByteBuffer(data.begin(), data.end()), nowSeconds()};
}

std::optional<ByteBuffer> MemoryStore::getObject(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = objects_.find(key);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second.data;
}

bool MemoryStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.contains(key);
}

void MemoryStore::removeObject(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(key);
}

void MemoryStore::setAccessDenied(const std::string& key, bool denied) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (denied) {
        denied_.insert(key);
    } else {
        denied_.erase(key);
    }
}

void MemoryStore::setHook(Hook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

StoreStats MemoryStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::vector<RangeWrite> MemoryStore::rangeWrites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rangeWrites_;
}

std::size_t MemoryStore::pendingUploads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.size();
}

void MemoryStore::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = StoreStats{};
    rangeWrites_.clear();
}

void MemoryStore::notify(const StoreEvent& event) {
    Hook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = hook_;
    }
    if (hook) {
        hook(event);
    }
}

void MemoryStore::checkAccess(const std::string& key) const {
    if (denied_.contains(key)) {
        throw StatusError(403, fmt::format("Access denied to \"{}\"", key));
    }
}

// =============================================================================
// MemoryStore: backend primitives
// =============================================================================

Header MemoryStore::head(const std::string& key) {
    notify(StoreEvent{StoreEventType::kHead, key});

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.heads;
    checkAccess(key);
    const auto it = objects_.find(key);
    if (it == objects_.end()) {
        throw StatusError(404, fmt::format("No such object \"{}\"", key));
    }
    return Header{{std::string(kContentLength), std::to_string(it->second.data.size())},
                  {std::string(kLastModified), std::to_string(it->second.modified)}};
}

ByteBuffer MemoryStore::readRange(const std::string& key, Offset start, Offset end) {
    notify(StoreEvent{StoreEventType::kRead, key, start, end});

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.reads;
    checkAccess(key);
    const auto it = objects_.find(key);
    if (it == objects_.end()) {
        throw StatusError(404, fmt::format("No such object \"{}\"", key));
    }
    const ByteBuffer& data = it->second.data;
    const Offset size = data.size();
    if (start >= size) {
        return {};
    }
    const Offset last = (end == 0) ? size : std::min(end, size);
    if (last <= start) {
        return {};
    }
    return ByteBuffer(data.begin() + static_cast<std::ptrdiff_t>(start),
                      data.begin() + static_cast<std::ptrdiff_t>(last));
}

void MemoryStore::put(const std::string& key, ByteSpan data) {
    notify(StoreEvent{StoreEventType::kPut, key, 0, data.size()});

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.puts;
    checkAccess(key);
    objects_[key] = StoredObject{ByteBuffer(data.begin(), data.end()), nowSeconds()};
}

void MemoryStore::writeRange(const std::string& key, ByteSpan data, Offset start, Offset end) {
    if (end - start != data.size()) {
        throw StatusError(400, fmt::format("Range [{}, {}) does not match {} bytes", start, end,
                                           data.size()));
    }
    notify(StoreEvent{StoreEventType::kRangeWrite, key, start, end});

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.rangeWrites;
    checkAccess(key);
    StoredObject& object = objects_[key];
    if (object.data.size() < end) {
        object.data.resize(end, 0);
    }
    std::copy(data.begin(), data.end(), object.data.begin() + static_cast<std::ptrdiff_t>(start));
    object.modified = nowSeconds();
    rangeWrites_.push_back(RangeWrite{key, start, end});
}

std::string MemoryStore::createUpload(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkAccess(key);
    std::string uploadId = fmt::format("upload-{}", nextUploadId_++);
    uploads_[uploadId] = Upload{key, {}};
    return uploadId;
}

std::string MemoryStore::uploadPart(const std::string& uploadId, PartNumber number,
                                    ByteSpan data) {
    std::string key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = uploads_.find(uploadId);
        if (it == uploads_.end()) {
            throw StatusError(404, fmt::format("No such upload \"{}\"", uploadId));
        }
        key = it->second.key;
    }
    notify(StoreEvent{StoreEventType::kUploadPart, key, 0, data.size(), number});

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = uploads_.find(uploadId);
    if (it == uploads_.end()) {
        throw StatusError(404, fmt::format("No such upload \"{}\"", uploadId));
    }
    ++stats_.partsUploaded;
    it->second.parts[number] = ByteBuffer(data.begin(), data.end());
    return computeEtag(data);
}

void MemoryStore::completeUpload(const std::string& uploadId, const std::vector<PartInfo>& parts,
                                 std::size_t minPartSize) {
    std::string key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = uploads_.find(uploadId);
        if (it == uploads_.end()) {
            throw StatusError(404, fmt::format("No such upload \"{}\"", uploadId));
        }
        key = it->second.key;
    }
    notify(StoreEvent{StoreEventType::kComplete, key});

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = uploads_.find(uploadId);
    if (it == uploads_.end()) {
        throw StatusError(404, fmt::format("No such upload \"{}\"", uploadId));
    }
    Upload& upload = it->second;

    ByteBuffer assembled;
    PartNumber previous = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const PartInfo& info = parts[i];
        if (info.number <= previous) {
            throw StatusError(400, "InvalidPartOrder: parts must be sorted by part number");
        }
        previous = info.number;

        const auto part = upload.parts.find(info.number);
        if (part == upload.parts.end() || computeEtag(part->second) != info.etag) {
            throw StatusError(400, fmt::format("InvalidPart: part {} is unknown", info.number));
        }
        const bool last = (i + 1 == parts.size());
        if (!last && part->second.size() < minPartSize) {
            throw StatusError(400, fmt::format("EntityTooSmall: part {} has {} bytes, minimum {}",
                                               info.number, part->second.size(), minPartSize));
        }
        assembled.insert(assembled.end(), part->second.begin(), part->second.end());
    }

    ++stats_.completes;
    objects_[upload.key] = StoredObject{std::move(assembled), nowSeconds()};
    uploads_.erase(it);
}

void MemoryStore::abortUpload(const std::string& uploadId) {
    std::string key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = uploads_.find(uploadId);
        if (it == uploads_.end()) {
            return;
        }
        key = it->second.key;
    }
    notify(StoreEvent{StoreEventType::kAbort, key});

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.aborts;
    uploads_.erase(uploadId);
}

// =============================================================================
// MemorySystem
// =============================================================================

MemorySystem::MemorySystem(std::shared_ptr<MemoryStore> store, Parameters parameters)
    : store_(std::move(store)), parameters_(std::move(parameters)) {
    if (!store_) {
        throw InvalidArgumentError("MemorySystem requires a store");
    }
    for (const auto& [name, value] : parameters_) {
        if (name == "memory.kind") {
            if (value == "block") {
                kind_ = ObjectKind::kBlock;
            } else if (value == "page") {
                kind_ = ObjectKind::kPage;
            } else {
                throw InvalidArgumentError(
                    fmt::format("Unknown memory object kind \"{}\"", value));
            }
        } else if (name == "memory.min_part_size") {
            minPartSize_ = parseSize(name, value);
        } else if (name == "memory.max_flush_size") {
            maxFlushSize_ = parseSize(name, value);
        } else {
            throw InvalidArgumentError(fmt::format("Unknown storage parameter \"{}\"", name));
        }
    }
}

std::vector<std::string> MemorySystem::roots() const {
    return {std::string(kRoot)};
}

ClientArgs MemorySystem::getClientArgs(std::string_view path) const {
    const std::string relative = relpath(path);
    ClientArgs args;
    args.path = std::string(path);
    const auto slash = relative.find('/');
    if (slash == std::string::npos) {
        args.locator = relative;
    } else {
        args.locator = relative.substr(0, slash);
        args.key = relative.substr(slash + 1);
    }
    return args;
}

std::string MemorySystem::storeKey(const ClientArgs& args) {
    return args.key.empty() ? args.locator : args.locator + "/" + args.key;
}

Header MemorySystem::headObject(const ClientArgs& args) {
    return store_->head(storeKey(args));
}

std::unique_ptr<ObjectBackend> MemorySystem::openObject(const ClientArgs& args) {
    if (args.key.empty()) {
        throw InvalidArgumentError(fmt::format("\"{}\" does not name an object", args.path));
    }
    return std::make_unique<MemoryBackend>(store_, storeKey(args), kind_, minPartSize_);
}

BackendTraits MemorySystem::traits() const {
    BackendTraits traits;
    traits.multipart = (kind_ == ObjectKind::kBlock);
    traits.randomWrite = (kind_ == ObjectKind::kPage);
    traits.maxFlushSize = maxFlushSize_;
    return traits;
}

std::shared_ptr<System> MemorySystem::withParameters(const Parameters& parameters) const {
    Parameters merged = parameters_;
    for (const auto& [name, value] : parameters) {
        merged[name] = value;
    }
    OBJFS_LOG_DEBUG("Memory system reconfigured with {} parameters", merged.size());
    return std::make_shared<MemorySystem>(store_, std::move(merged));
}

}  // namespace objfs::storage
