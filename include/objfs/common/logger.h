// =============================================================================
// objfs - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging from stream owner threads and pool workers
//
// Usage:
//   objfs::log::init("objfs.log", objfs::log::Level::kInfo);
//   OBJFS_LOG_INFO("opened {} ({} bytes)", path, size);
//
// Library code may log before init() is called: the first logger() access
// installs a console logger at warning level.
// =============================================================================

#ifndef OBJFS_COMMON_LOGGER_H
#define OBJFS_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace objfs::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "objfs";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Only the first call takes effect; later calls are ignored.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, never null.
/// @note Performs a default initialization (console, warning level) when
///       init() has not been called yet.
[[nodiscard]] quill::Logger* logger();

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Change the level of the already initialized logger.
void setLevel(Level level);

/// @brief Flush all pending log messages.
/// @note Blocks until all messages are written.
void flush();

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level.
/// @param levelStr String representation (case-insensitive).
/// @return Corresponding log level, defaults to kInfo for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace objfs::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define OBJFS_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(objfs::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define OBJFS_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(objfs::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define OBJFS_LOG_INFO(fmt, ...) \
    LOG_INFO(objfs::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define OBJFS_LOG_WARNING(fmt, ...) \
    LOG_WARNING(objfs::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define OBJFS_LOG_ERROR(fmt, ...) \
    LOG_ERROR(objfs::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define OBJFS_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(objfs::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // OBJFS_COMMON_LOGGER_H
