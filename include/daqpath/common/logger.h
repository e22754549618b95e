// =============================================================================
// daqpath - Logger Module
// =============================================================================
// Asynchronous logging using the Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging (Quill is inherently thread-safe)
//
// Library code logs through the DAQPATH_LOG_* macros; until init() has been
// called those macros are no-ops, so the compressor and the driver boundary
// can be used without any logging setup.
//
// Usage:
//   daqpath::log::Config config;
//   config.level = daqpath::log::Level::kDebug;
//   daqpath::log::init(config);
//   DAQPATH_LOG_INFO("loaded {}", path);
// =============================================================================

#ifndef DAQPATH_COMMON_LOGGER_H
#define DAQPATH_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace daqpath::log {

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

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "daqpath";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Call once at application startup; later calls are ignored.
void init(const Config& config);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush and stop the logging backend.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert daqpath::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, kInfo if unknown).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace daqpath::log

// =============================================================================
// Convenience Macros
// =============================================================================
// The logger pointer is checked first so that library code stays silent when
// the host application never initialized logging.

#define DAQPATH_LOG_IMPL(macro, fmt, ...)                                  \
    do {                                                                   \
        if (quill::Logger* daqpathLogger = daqpath::log::logger()) {       \
            macro(daqpathLogger, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                  \
    } while (false)

/// @brief Log a trace message.
#define DAQPATH_LOG_TRACE(fmt, ...) DAQPATH_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define DAQPATH_LOG_DEBUG(fmt, ...) DAQPATH_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define DAQPATH_LOG_INFO(fmt, ...) DAQPATH_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define DAQPATH_LOG_WARNING(fmt, ...) DAQPATH_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define DAQPATH_LOG_ERROR(fmt, ...) DAQPATH_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define DAQPATH_LOG_CRITICAL(fmt, ...) DAQPATH_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // DAQPATH_COMMON_LOGGER_H
