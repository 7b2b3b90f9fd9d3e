#include "keyward/debug/logger.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>

namespace keyward::debug {

namespace {
    std::atomic<LogLevel> g_level{LogLevel::Warn};
    std::mutex g_sink_mutex;
    LogSink g_sink;
}

std::string_view LogLevelName(const LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (const char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "off" || lowered == "none") return LogLevel::Off;
    return std::nullopt;
}

void Logger::SetLevel(const LogLevel level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel Logger::GetLevel() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool Logger::IsEnabled(const LogLevel level) noexcept {
    const LogLevel current = GetLevel();
    return current != LogLevel::Off && level >= current;
}

void Logger::SetSink(LogSink sink) {
    std::lock_guard lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void Logger::Write(const LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(g_sink_mutex);
    if (g_sink) {
        g_sink(level, component, message);
        return;
    }
    const std::string_view name = LogLevelName(level);
    fprintf(stderr, "[keyward] %.*s %.*s: %.*s\n",
        static_cast<int>(name.size()), name.data(),
        static_cast<int>(component.size()), component.data(),
        static_cast<int>(message.size()), message.data());
    fflush(stderr);
}

} // namespace keyward::debug
