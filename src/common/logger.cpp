// =============================================================================
// daqpath - Logger Module Implementation
// =============================================================================

#include "daqpath/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace daqpath::log {

namespace {

/// @brief Process-wide logger state. logger is null until init().
struct LoggerState {
    std::mutex mutex;
    std::atomic<quill::Logger*> logger{nullptr};
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

struct LevelName {
    std::string_view name;
    Level level;
};

// Canonical names first; levelToString() returns the first match.
constexpr std::array<LevelName, 8> kLevelNames = {{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"warn", Level::kWarning},
    {"fatal", Level::kCritical},
}};

constexpr std::array<quill::LogLevel, 6> kQuillLevels = {
    quill::LogLevel::TraceL1, quill::LogLevel::Debug, quill::LogLevel::Info,
    quill::LogLevel::Warning, quill::LogLevel::Error, quill::LogLevel::Critical,
};

[[nodiscard]] bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

[[nodiscard]] std::shared_ptr<quill::Sink> openFileSink(const std::string& path) {
    quill::FileSinkConfig fileConfig;
    fileConfig.set_open_mode('a');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, fileConfig,
                                                                quill::FileEventNotifier{});
}

[[nodiscard]] std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        sinks.push_back(openFileSink(config.logFile));
    }

    // Console output is also the fallback when no file was requested
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }
    return sinks;
}

}  // namespace

// =============================================================================
// Level Conversion
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    return index < kQuillLevels.size() ? kQuillLevels[index] : quill::LogLevel::Info;
}

Level levelFromString(std::string_view levelStr) noexcept {
    auto it = std::find_if(
        kLevelNames.begin(), kLevelNames.end(),
        [levelStr](const LevelName& entry) { return equalsIgnoreCase(entry.name, levelStr); });
    return it != kLevelNames.end() ? it->level : Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                           [level](const LevelName& entry) { return entry.level == level; });
    return it != kLevelNames.end() ? it->name : "info";
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.logger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    created->set_log_level(toQuillLevel(config.level));

    s.logger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return state().logger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    quill::Logger* current = s.logger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }

    current->flush_log();
    quill::Backend::stop();
}

}  // namespace daqpath::log
