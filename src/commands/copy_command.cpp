// =============================================================================
// objfs - Copy Command Implementation
// =============================================================================

#include "copy_command.h"

#include <utility>

#include "objfs/common/error.h"
#include "objfs/common/logger.h"
#include "objfs/io/open.h"

namespace objfs::commands {

CopyCommand::CopyCommand(CopyOptions options,
                         std::shared_ptr<const storage::StorageRegistry> registry)
    : options_(std::move(options)), registry_(std::move(registry)) {}

int CopyCommand::execute() {
    try {
        if (!options_.force && io::exists(*registry_, options_.destination)) {
            throw AlreadyExistsError("Destination exists (use --force to overwrite)",
                                     ErrorContext(options_.destination));
        }
        bytesCopied_ =
            io::copyObject(*registry_, options_.source, options_.destination, options_.stream);
        return 0;

    } catch (const ObjfsException& e) {
        OBJFS_LOG_ERROR("cp failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace objfs::commands
