// =============================================================================
// gzchunk - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// One process-wide logger writing to the console and, optionally, a file.
//
// Library code logs through the GZC_LOG_* macros, which do nothing until
// init() has been called, so the codec can be embedded without a logger.
//
// Usage:
//   gzc::log::Config config;
//   config.level = gzc::log::Level::kDebug;
//   gzc::log::init(config);
//   GZC_LOG_INFO("Sealed {} parts", count);
// =============================================================================

#ifndef GZC_COMMON_LOGGER_H
#define GZC_COMMON_LOGGER_H

#include <string>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace gzc::log {

/// @brief Severity threshold, mapped onto quill levels by toQuillLevel().
enum class Level { kTrace, kDebug, kInfo, kWarning, kError, kCritical };

struct Config {
    /// @brief Also append to this file when set.
    std::string logFile;
    Level level = Level::kInfo;
    std::string loggerName = "gzc";
};

/// @brief Start the quill backend and create the process logger.
/// @note Later calls are no-ops until shutdown().
void init(const Config& config);

/// @return The process logger, nullptr before init() or after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Flush and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace gzc::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define GZC_LOG_IMPL(quillMacro, fmt, ...)                                   \
    do {                                                                     \
        if (quill::Logger* gzcLogger_ = ::gzc::log::logger()) {              \
            quillMacro(gzcLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                    \
    } while (false)

/// @brief Log a trace message.
#define GZC_LOG_TRACE(fmt, ...) GZC_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define GZC_LOG_DEBUG(fmt, ...) GZC_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define GZC_LOG_INFO(fmt, ...) GZC_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define GZC_LOG_WARNING(fmt, ...) GZC_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define GZC_LOG_ERROR(fmt, ...) GZC_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define GZC_LOG_CRITICAL(fmt, ...) GZC_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // GZC_COMMON_LOGGER_H
