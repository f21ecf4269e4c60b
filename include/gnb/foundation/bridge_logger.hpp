#pragma once

/// @file bridge_logger.hpp
/// @brief BridgeLogger wrapping kcenon logger interfaces for categorized logging.
///
/// Provides category-based filtering and per-category runtime log level
/// control. Output goes to whichever kcenon ILogger is registered in the
/// GlobalLoggerRegistry; the bridge executables register a StderrLogger,
/// because stdout carries the wire protocol.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "gnb/foundation/bridge_result.hpp"

namespace gnb::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Process lifecycle, configuration
    Protocol  = 1, ///< Wire framing, codec, handshake
    DBus      = 2, ///< Session bus traffic
    Sanitizer = 3, ///< Rejected or rewritten untrusted input
    Host      = 4, ///< Host daemon and notification emitter
    Guest     = 5  ///< Guest agent
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Protocol", "DBus", "Sanitizer", "Host", "Guest"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in configuration ("debug", "WARNING", ...).
/// "warn" is accepted as an alias for "warning".
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Categorized logger wrapping kcenon's logging interfaces.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Protocol  | Info          |
/// | DBus      | Info          |
/// | Sanitizer | Warning       |
/// | Host      | Info          |
/// | Guest     | Info          |
///
/// Example:
/// @code
///   BridgeLogger::instance().log(LogLevel::Info, LogCategory::Core, "starting");
///   GNB_LOG_WARN(LogCategory::Sanitizer, "invalid category refused");
/// @endcode
class BridgeLogger {
public:
    BridgeLogger();
    ~BridgeLogger();

    BridgeLogger(const BridgeLogger&) = delete;
    BridgeLogger& operator=(const BridgeLogger&) = delete;
    BridgeLogger(BridgeLogger&&) noexcept;
    BridgeLogger& operator=(BridgeLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set the same minimum level for every category.
    void setLevel(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registered default logger.
    BridgeResult<void> flush();

    static BridgeLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gnb::foundation

/// @name GNB_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// GNB_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef GNB_MIN_LOG_LEVEL
    #define GNB_MIN_LOG_LEVEL 0
#endif

#define GNB_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= GNB_MIN_LOG_LEVEL &&                        \
            ::gnb::foundation::BridgeLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::gnb::foundation::BridgeLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define GNB_LOG_DEBUG(cat, msg) \
    GNB_LOG(::gnb::foundation::LogLevel::Debug, (cat), (msg))

#define GNB_LOG_INFO(cat, msg) \
    GNB_LOG(::gnb::foundation::LogLevel::Info, (cat), (msg))

#define GNB_LOG_WARN(cat, msg) \
    GNB_LOG(::gnb::foundation::LogLevel::Warning, (cat), (msg))

#define GNB_LOG_ERROR(cat, msg) \
    GNB_LOG(::gnb::foundation::LogLevel::Error, (cat), (msg))

/// @}
