// =============================================================================
// seqchunk - Logger Module
// =============================================================================
// Asynchronous logging on top of Quill.
//
// Library code logs through the SEQCHUNK_LOG_* macros, which do nothing until
// init() has installed a logger. Embedding applications and tests that never
// call init() get silent stores.
//
// Usage:
//   seqchunk::log::Config config;
//   config.level = seqchunk::log::levelForVerbosity(verbosity, quiet);
//   seqchunk::log::init(config);
//   SEQCHUNK_LOG_INFO("Stored {} chunks of {}", count, accession);
//   seqchunk::log::shutdown();
// =============================================================================

#ifndef SEQCHUNK_COMMON_LOGGER_H
#define SEQCHUNK_COMMON_LOGGER_H

#include <string>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace seqchunk::log {

/// @brief Severity threshold for emitted messages.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError
};

/// @brief Logger setup used by init().
struct Config {
    /// @brief Minimum level written to the sinks.
    Level level = Level::kInfo;

    /// @brief Additional log file, appended to. Empty means stderr only.
    std::string logFile;

    /// @brief Name under which the Quill logger is registered.
    std::string loggerName = "seqchunk";
};

/// @brief Install the process-wide logger and start the Quill backend.
/// @note A second call while a logger is installed is ignored.
void init(const Config& config);

/// @brief Flush pending messages and stop the Quill backend.
void shutdown();

/// @brief The installed logger, or nullptr when init() has not run.
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Map the command-line -q / -v flags to a level.
/// @param verbosity Number of -v flags given.
/// @param quiet True when -q was given; wins over any verbosity.
[[nodiscard]] Level levelForVerbosity(int verbosity, bool quiet) noexcept;

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace seqchunk::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define SEQCHUNK_LOG_IMPL_(macro, fmt, ...)                                  \
    do {                                                                     \
        if (quill::Logger* seqchunkLogger_ = seqchunk::log::logger()) {      \
            macro(seqchunkLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                    \
    } while (false)

#define SEQCHUNK_LOG_TRACE(fmt, ...) \
    SEQCHUNK_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SEQCHUNK_LOG_DEBUG(fmt, ...) \
    SEQCHUNK_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SEQCHUNK_LOG_INFO(fmt, ...) \
    SEQCHUNK_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SEQCHUNK_LOG_WARNING(fmt, ...) \
    SEQCHUNK_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SEQCHUNK_LOG_ERROR(fmt, ...) \
    SEQCHUNK_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // SEQCHUNK_COMMON_LOGGER_H
