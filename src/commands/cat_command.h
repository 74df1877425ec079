// =============================================================================
// objfs - Cat Command
// =============================================================================
// Streams an object to standard output.
// =============================================================================

#ifndef OBJFS_COMMANDS_CAT_COMMAND_H
#define OBJFS_COMMANDS_CAT_COMMAND_H

#include <memory>
#include <ostream>
#include <string>

#include "objfs/common/config.h"
#include "objfs/storage/registry.h"

namespace objfs::commands {

/// @brief Configuration options for the cat command.
struct CatOptions {
    /// @brief Object path or URL.
    std::string path;

    /// @brief Stream tuning (buffer size, prefetch depth, workers).
    StreamConfig stream;
};

class CatCommand {
public:
    CatCommand(CatOptions options, std::shared_ptr<const storage::StorageRegistry> registry,
               std::ostream& output);

    CatCommand(const CatCommand&) = delete;
    CatCommand& operator=(const CatCommand&) = delete;

    /// @brief Execute the cat command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

private:
    CatOptions options_;
    std::shared_ptr<const storage::StorageRegistry> registry_;
    std::ostream& output_;
};

}  // namespace objfs::commands

#endif  // OBJFS_COMMANDS_CAT_COMMAND_H
