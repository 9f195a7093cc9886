// =============================================================================
// tag-counter - Logger Module
// =============================================================================
// Asynchronous logging using the Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console (stderr) and optional file output
//
// Usage:
//   tagc::log::init("run.log", tagc::log::Level::kInfo);
//   TAGC_LOG_INFO("reading file {}", name);
// =============================================================================

#ifndef TAGC_COMMON_LOGGER_H
#define TAGC_COMMON_LOGGER_H

#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace tagc::log {

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
// Logger Initialization and Access
// =============================================================================

/// @brief Start the backend and create the global logger.
/// @param logFile Also log to this file (truncated) when not empty.
/// @param level Minimum level to output.
/// @note Later calls are ignored until shutdown().
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Global logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

}  // namespace tagc::log

// =============================================================================
// Convenience Macros
// =============================================================================

/// @brief Log a trace message.
#define TAGC_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(tagc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define TAGC_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(tagc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define TAGC_LOG_INFO(fmt, ...) \
    LOG_INFO(tagc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define TAGC_LOG_WARNING(fmt, ...) \
    LOG_WARNING(tagc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define TAGC_LOG_ERROR(fmt, ...) \
    LOG_ERROR(tagc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define TAGC_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(tagc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // TAGC_COMMON_LOGGER_H
