// =============================================================================
// objfs - Streaming Object Storage I/O
// =============================================================================
// Main entry point for the objfs command-line tool.
//
// - Subcommands: cat, cp, stat
// - Global options: buffer size, prefetch depth, workers, logging
// - Local paths and file:// URLs resolve to the local filesystem
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "objfs/common/config.h"
#include "objfs/common/error.h"
#include "objfs/common/logger.h"
#include "objfs/storage/local_system.h"
#include "objfs/storage/registry.h"

#include "commands/cat_command.h"
#include "commands/copy_command.h"
#include "commands/stat_command.h"

namespace {

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription = "objfs - streaming reads and writes over object storage";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::size_t bufferSize = 0;
    std::size_t maxBuffers = 0;
    std::size_t workers = 0;
    bool unbuffered = false;
    int verbosity = 0;
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

struct CliCatOptions {
    std::string path;
};

struct CliCopyOptions {
    std::string source;
    std::string destination;
    bool force = false;
};

struct CliStatOptions {
    std::string path;
    bool json = false;
};

CliCatOptions gCatOptions;
CliCopyOptions gCopyOptions;
CliStatOptions gStatOptions;

// =============================================================================
// Helpers
// =============================================================================

objfs::StreamConfig streamConfig() {
    objfs::StreamConfig config;
    config.bufferSize = gOptions.bufferSize;
    config.maxBuffers = gOptions.maxBuffers;
    config.maxWorkers = gOptions.workers;
    config.buffered = !gOptions.unbuffered;
    return config;
}

/// Relative local paths become absolute so they match the "/" root.
std::string resolvePath(const std::string& path) {
    if (path.find("://") != std::string::npos) {
        return path;
    }
    return std::filesystem::absolute(path).lexically_normal().string();
}

std::shared_ptr<objfs::storage::StorageRegistry> makeRegistry() {
    auto registry = std::make_shared<objfs::storage::StorageRegistry>();
    registry->mount(std::make_shared<objfs::storage::LocalSystem>());
    return registry;
}

// =============================================================================
// Subcommand Setup
// =============================================================================

CLI::App* setupCatCommand(CLI::App& app) {
    auto* cmd = app.add_subcommand("cat", "Write an object to standard output");
    cmd->add_option("path", gCatOptions.path, "Object path or URL")->required();
    return cmd;
}

CLI::App* setupCopyCommand(CLI::App& app) {
    auto* cmd = app.add_subcommand("cp", "Copy an object");
    cmd->alias("copy");
    cmd->add_option("source", gCopyOptions.source, "Source path or URL")->required();
    cmd->add_option("destination", gCopyOptions.destination, "Destination path or URL")
        ->required();
    cmd->add_flag("-f,--force", gCopyOptions.force, "Overwrite an existing destination");
    return cmd;
}

CLI::App* setupStatCommand(CLI::App& app) {
    auto* cmd = app.add_subcommand("stat", "Show object size and modification time");
    cmd->add_option("path", gStatOptions.path, "Object path or URL")->required();
    cmd->add_flag("--json", gStatOptions.json, "Output in JSON format");
    return cmd;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_option("--buffer-size", gOptions.bufferSize,
                   "Buffer size in bytes (0 = storage default)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--max-buffers", gOptions.maxBuffers,
                   "Prefetch depth or in-flight parts (0 = storage default)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--workers", gOptions.workers, "Worker threads (0 = auto)")
        ->check(CLI::Range(0, 1024));
    app.add_flag("--unbuffered", gOptions.unbuffered, "Use unbuffered streams");
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v info, -vv debug)");
    app.add_flag("-q,--quiet", gOptions.quiet, "Only print errors");
    app.add_option("--log-file", gOptions.logFile, "Write logs to a file");

    auto* catCmd = setupCatCommand(app);
    auto* copyCmd = setupCopyCommand(app);
    auto* statCmd = setupStatCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    objfs::log::Level level = objfs::log::Level::kWarning;
    if (gOptions.quiet) {
        level = objfs::log::Level::kError;
    } else if (gOptions.verbosity >= 2) {
        level = objfs::log::Level::kDebug;
    } else if (gOptions.verbosity == 1) {
        level = objfs::log::Level::kInfo;
    }

    try {
        objfs::log::init(gOptions.logFile, level);
        const auto registry = makeRegistry();
        const auto config = streamConfig();
        objfs::unwrapOrThrow(config.validate());

        int result = EXIT_FAILURE;
        if (catCmd->parsed()) {
            objfs::commands::CatOptions opts;
            opts.path = resolvePath(gCatOptions.path);
            opts.stream = config;
            result = objfs::commands::CatCommand(opts, registry, std::cout).execute();
        } else if (copyCmd->parsed()) {
            objfs::commands::CopyOptions opts;
            opts.source = resolvePath(gCopyOptions.source);
            opts.destination = resolvePath(gCopyOptions.destination);
            opts.force = gCopyOptions.force;
            opts.stream = config;
            result = objfs::commands::CopyCommand(opts, registry).execute();
        } else if (statCmd->parsed()) {
            objfs::commands::StatOptions opts;
            opts.path = resolvePath(gStatOptions.path);
            opts.jsonOutput = gStatOptions.json;
            result = objfs::commands::StatCommand(opts, registry, std::cout).execute();
        }

        objfs::log::shutdown();
        return result;

    } catch (const objfs::ObjfsException& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return ex.exitCode();
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
