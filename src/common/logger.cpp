// =============================================================================
// seqchunk - Logger Module Implementation
// =============================================================================

#include "seqchunk/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace seqchunk::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gLifecycleMutex;

/// @brief stderr always; the log file as well when one is configured.
std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("seqchunk_stderr"));

    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('a');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }
    return sinks;
}

}  // namespace

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
    }
    return quill::LogLevel::Info;
}

Level levelForVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    return verbosity == 1 ? Level::kDebug : Level::kInfo;
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* installed = quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    installed->set_log_level(toQuillLevel(config.level));
    gLogger.store(installed, std::memory_order_release);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* installed = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (installed == nullptr) {
        return;
    }
    installed->flush_log();
    quill::Backend::stop();
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

}  // namespace seqchunk::log
