// =============================================================================
// objfs - Stat Command Implementation
// =============================================================================

#include "stat_command.h"

#include <utility>

#include <fmt/format.h>

#include "objfs/common/error.h"
#include "objfs/common/logger.h"
#include "objfs/io/open.h"

namespace objfs::commands {

StatCommand::StatCommand(StatOptions options,
                         std::shared_ptr<const storage::StorageRegistry> registry,
                         std::ostream& output)
    : options_(std::move(options)), registry_(std::move(registry)), output_(output) {}

int StatCommand::execute() {
    try {
        const Offset size = io::getSize(*registry_, options_.path);
        const std::int64_t mtime = io::getMtime(*registry_, options_.path);
        const auto storage = registry_->resolve(options_.path)->storageName();

        if (options_.jsonOutput) {
            output_ << fmt::format(
                "{{\"path\": \"{}\", \"storage\": \"{}\", \"size\": {}, \"mtime\": {}}}\n",
                options_.path, storage, size, mtime);
        } else {
            output_ << fmt::format("path:     {}\nstorage:  {}\nsize:     {}\nmodified: {}\n",
                                   options_.path, storage, size, mtime);
        }
        return 0;

    } catch (const ObjfsException& e) {
        OBJFS_LOG_ERROR("stat failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace objfs::commands
