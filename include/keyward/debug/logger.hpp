#pragma once

/**
 * @file logger.hpp
 * @brief Leveled stderr logging for keyward components.
 *
 * Messages are formatted with {fmt} and written as
 * "[keyward] LEVEL component: message". Tests may install a sink to observe
 * events such as storage degradation.
 *
 * Key material is never logged unless KEYWARD_DEBUG_KEYS is defined.
 * NEVER enable it in production builds.
 *
 * Enable via CMake: -DKEYWARD_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace keyward::debug {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

using LogSink = std::function<void(LogLevel, std::string_view component, std::string_view message)>;

[[nodiscard]] std::string_view LogLevelName(LogLevel level) noexcept;

/// Parses "debug", "info", "warn", "error" or "off" (case-insensitive).
[[nodiscard]] std::optional<LogLevel> ParseLogLevel(std::string_view text);

class Logger {
public:
    static void SetLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel GetLevel() noexcept;
    [[nodiscard]] static bool IsEnabled(LogLevel level) noexcept;

    /// Replaces stderr output with a custom sink. Pass nullptr to restore stderr.
    static void SetSink(LogSink sink);

    static void Write(LogLevel level, std::string_view component, std::string_view message);

private:
    Logger() = delete;
};

} // namespace keyward::debug

#define KEYWARD_LOG_AT(level, component, ...) \
    do { \
        if (::keyward::debug::Logger::IsEnabled(level)) { \
            ::keyward::debug::Logger::Write(level, component, ::fmt::format(__VA_ARGS__)); \
        } \
    } while(0)

#define KEYWARD_LOG_DEBUG(component, ...) KEYWARD_LOG_AT(::keyward::debug::LogLevel::Debug, component, __VA_ARGS__)
#define KEYWARD_LOG_INFO(component, ...) KEYWARD_LOG_AT(::keyward::debug::LogLevel::Info, component, __VA_ARGS__)
#define KEYWARD_LOG_WARN(component, ...) KEYWARD_LOG_AT(::keyward::debug::LogLevel::Warn, component, __VA_ARGS__)
#define KEYWARD_LOG_ERROR(component, ...) KEYWARD_LOG_AT(::keyward::debug::LogLevel::Error, component, __VA_ARGS__)

#ifdef KEYWARD_DEBUG_KEYS

namespace keyward::debug {

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 64) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    std::string result;
    result.reserve(shown * 2);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...(" + std::to_string(data.size()) + " bytes)";
    }
    return result;
}

} // namespace keyward::debug

#define KEYWARD_LOG_KEY(component, key_name, data) \
    KEYWARD_LOG_AT(::keyward::debug::LogLevel::Debug, component, "{}: {}", \
        key_name, ::keyward::debug::ToHexTruncated(data))

#else // !KEYWARD_DEBUG_KEYS

#define KEYWARD_LOG_KEY(component, key_name, data) ((void)0)

#endif // KEYWARD_DEBUG_KEYS
