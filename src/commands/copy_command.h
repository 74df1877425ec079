// =============================================================================
// objfs - Copy Command
// =============================================================================
// Copies one object to another location, across storages if needed.
// =============================================================================

#ifndef OBJFS_COMMANDS_COPY_COMMAND_H
#define OBJFS_COMMANDS_COPY_COMMAND_H

#include <memory>
#include <string>

#include "objfs/common/config.h"
#include "objfs/storage/registry.h"

namespace objfs::commands {

/// @brief Configuration options for the copy command.
struct CopyOptions {
    std::string source;
    std::string destination;

    /// @brief Overwrite an existing destination.
    bool force = false;

    StreamConfig stream;
};

class CopyCommand {
public:
    CopyCommand(CopyOptions options, std::shared_ptr<const storage::StorageRegistry> registry);

    CopyCommand(const CopyCommand&) = delete;
    CopyCommand& operator=(const CopyCommand&) = delete;

    /// @brief Execute the copy command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Bytes copied by the last execute().
    [[nodiscard]] Offset bytesCopied() const noexcept { return bytesCopied_; }

private:
    CopyOptions options_;
    std::shared_ptr<const storage::StorageRegistry> registry_;
    Offset bytesCopied_ = 0;
};

}  // namespace objfs::commands

#endif  // OBJFS_COMMANDS_COPY_COMMAND_H
