// =============================================================================
// objfs - Stream Factory and Object Functions Implementation
// =============================================================================

#include "objfs/io/open.h"

#include <string>
#include <utility>

#include <fmt/format.h>

#include "objfs/common/error.h"
#include "objfs/common/logger.h"
#include "objfs/io/buffered_stream.h"
#include "objfs/io/random_write_stream.h"
#include "objfs/io/raw_stream.h"

namespace objfs::io {

namespace {

std::shared_ptr<storage::System> resolveSystem(const storage::StorageRegistry& registry,
                                               std::string_view path,
                                               const Parameters& parameters) {
    std::shared_ptr<storage::System> system = registry.resolve(path);
    if (!parameters.empty()) {
        system = system->withParameters(parameters);
    }
    return system;
}

}  // namespace

std::unique_ptr<ObjectStream> open(const storage::StorageRegistry& registry,
                                   std::string_view path, std::string_view mode,
                                   const StreamConfig& config) {
    unwrapOrThrow(config.validate());
    const OpenMode openMode = OpenMode::fromString(mode);
    std::shared_ptr<storage::System> system =
        resolveSystem(registry, path, config.storageParameters);
    const storage::BackendTraits traits = system->traits();
    std::string name(path);

    if (openMode.access == AccessMode::kAppend || !config.buffered) {
        if (traits.randomWrite) {
            return std::make_unique<RandomWriteRaw>(std::move(system), std::move(name), openMode);
        }
        return std::make_unique<RawStream>(std::move(system), std::move(name), openMode);
    }

    if (openMode.writable() && !traits.multipart && !traits.randomWrite) {
        throw UnsupportedOperationError(
            fmt::format("{} storage cannot be written through a buffered stream",
                        system->storageName()),
            ErrorContext(name));
    }

    if (traits.randomWrite) {
        auto raw = std::make_unique<RandomWriteRaw>(system, name, openMode);
        return std::make_unique<RandomWriteBuffered>(std::move(raw), config);
    }
    auto raw = std::make_unique<RawStream>(system, name, openMode);
    return std::make_unique<BufferedStream>(std::move(raw), config);
}

// =============================================================================
// Object Functions
// =============================================================================

bool exists(const storage::StorageRegistry& registry, std::string_view path) {
    std::shared_ptr<storage::System> system = registry.resolve(path);
    const auto found = system->exists(system->getClientArgs(path));
    if (!found.has_value()) {
        throw PermissionDeniedError("Insufficient permission to check existence",
                                    ErrorContext(std::string(path)));
    }
    return *found;
}

Offset getSize(const storage::StorageRegistry& registry, std::string_view path) {
    std::shared_ptr<storage::System> system = registry.resolve(path);
    return system->getSize(system->head(system->getClientArgs(path)));
}

std::int64_t getMtime(const storage::StorageRegistry& registry, std::string_view path) {
    std::shared_ptr<storage::System> system = registry.resolve(path);
    return system->getMtime(system->head(system->getClientArgs(path)));
}

Offset copyObject(const storage::StorageRegistry& registry, std::string_view source,
                  std::string_view destination, const StreamConfig& config) {
    auto input = open(registry, source, "rb", config);
    auto output = open(registry, destination, "wb", config);

    const std::size_t chunkSize = (config.bufferSize != 0) ? config.bufferSize : kDefaultBufferSize;

    Offset copied = 0;
    while (true) {
        const ByteBuffer chunk = input->read(static_cast<std::int64_t>(chunkSize));
        if (chunk.empty()) {
            break;
        }
        copied += output->write(chunk);
    }
    output->close();
    input->close();
    OBJFS_LOG_INFO("Copied {} bytes from \"{}\" to \"{}\"", copied, source, destination);
    return copied;
}

}  // namespace objfs::io
