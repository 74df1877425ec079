// =============================================================================
// objfs - Stat Command
// =============================================================================
// Prints the size and modification time of an object.
// =============================================================================

#ifndef OBJFS_COMMANDS_STAT_COMMAND_H
#define OBJFS_COMMANDS_STAT_COMMAND_H

#include <memory>
#include <ostream>
#include <string>

#include "objfs/storage/registry.h"

namespace objfs::commands {

/// @brief Configuration options for the stat command.
struct StatOptions {
    std::string path;

    /// @brief Output as JSON.
    bool jsonOutput = false;
};

class StatCommand {
public:
    StatCommand(StatOptions options, std::shared_ptr<const storage::StorageRegistry> registry,
                std::ostream& output);

    StatCommand(const StatCommand&) = delete;
    StatCommand& operator=(const StatCommand&) = delete;

    /// @brief Execute the stat command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

private:
    StatOptions options_;
    std::shared_ptr<const storage::StorageRegistry> registry_;
    std::ostream& output_;
};

}  // namespace objfs::commands

#endif  // OBJFS_COMMANDS_STAT_COMMAND_H
