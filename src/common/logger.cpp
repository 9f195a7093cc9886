// =============================================================================
// tag-counter - Logger Module Implementation
// =============================================================================

#include "tagc/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tagc::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gInitMutex;

constexpr const char* kLoggerName = "tagc";

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
        case Level::kInfo:
        default:
            return quill::LogLevel::Info;
    }
}

}  // namespace

// =============================================================================
// Initialization
// =============================================================================

void init(std::string_view logFile, Level level) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    // The count table may go to stdout, so the console sink is always stderr
    quill::ConsoleSinkConfig consoleConfig;
    consoleConfig.set_stream("stderr");

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(
        quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console", consoleConfig));

    if (!logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            std::string(logFile), fileConfig, quill::FileEventNotifier{}));
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger(kLoggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(level));
    gLogger.store(created, std::memory_order_release);
}

// =============================================================================
// Access and Teardown
// =============================================================================

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* current = logger(); current != nullptr) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (!isInitialized()) {
        return;
    }
    flush();
    quill::Backend::stop();
    gLogger.store(nullptr, std::memory_order_release);
}

}  // namespace tagc::log
