// =============================================================================
// gzchunk - Logger Module Implementation
// =============================================================================

#include "gzc/common/logger.h"

#include <atomic>
#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace gzc::log {

namespace {

/// Null until init(); the GZC_LOG_* macros read it without locking.
std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gLifecycleMutex;

constexpr const char* kConsoleSinkName = "gzc_console";

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>(kConsoleSinkName));

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
    constexpr quill::LogLevel kLevels[] = {
        quill::LogLevel::TraceL1, quill::LogLevel::Debug, quill::LogLevel::Info,
        quill::LogLevel::Warning, quill::LogLevel::Error, quill::LogLevel::Critical,
    };
    const auto index = static_cast<std::size_t>(level);
    return index < std::size(kLevels) ? kLevels[index] : quill::LogLevel::Info;
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace gzc::log
