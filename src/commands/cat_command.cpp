// =============================================================================
// objfs - Cat Command Implementation
// =============================================================================

#include "cat_command.h"

#include <utility>

#include "objfs/common/error.h"
#include "objfs/common/logger.h"
#include "objfs/io/open.h"

namespace objfs::commands {

CatCommand::CatCommand(CatOptions options,
                       std::shared_ptr<const storage::StorageRegistry> registry,
                       std::ostream& output)
    : options_(std::move(options)), registry_(std::move(registry)), output_(output) {}

int CatCommand::execute() {
    try {
        auto stream = io::open(*registry_, options_.path, "rb", options_.stream);
        const std::size_t chunkSize =
            (options_.stream.bufferSize != 0) ? options_.stream.bufferSize : kDefaultBufferSize;

        Offset total = 0;
        while (true) {
            const ByteBuffer chunk = stream->read(static_cast<std::int64_t>(chunkSize));
            if (chunk.empty()) {
                break;
            }
            output_.write(reinterpret_cast<const char*>(chunk.data()),
                          static_cast<std::streamsize>(chunk.size()));
            if (!output_) {
                throw IOError("Failed to write to standard output");
            }
            total += chunk.size();
        }
        stream->close();
        output_.flush();
        OBJFS_LOG_DEBUG("Wrote {} bytes of \"{}\"", total, options_.path);
        return 0;

    } catch (const ObjfsException& e) {
        OBJFS_LOG_ERROR("cat failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace objfs::commands
