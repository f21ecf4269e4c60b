/// @file stderr_logger.cpp
/// @brief StderrLogger implementation.

#include "gnb/foundation/stderr_logger.hpp"

#include <chrono>
#include <ctime>

namespace gnb::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// ISO 8601 timestamp with millisecond precision (UTC)
// ---------------------------------------------------------------------------
static std::string formatTimestamp() {
    using Clock = std::chrono::system_clock;
    auto now = Clock::now();
    auto epoch = now.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(epoch) -
                  std::chrono::duration_cast<std::chrono::milliseconds>(seconds);

    std::time_t tt = Clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    char buf[96];  // Oversized to satisfy GCC -Wformat-truncation
    std::snprintf(buf,
                  sizeof(buf),
                  "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900,
                  utc.tm_mon + 1,
                  utc.tm_mday,
                  utc.tm_hour,
                  utc.tm_min,
                  utc.tm_sec,
                  static_cast<int>(millis.count()));
    return buf;
}

static std::string_view levelName(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:    return "TRACE";
        case kci::log_level::debug:    return "DEBUG";
        case kci::log_level::info:     return "INFO";
        case kci::log_level::warning:  return "WARNING";
        case kci::log_level::error:    return "ERROR";
        case kci::log_level::critical: return "CRITICAL";
        default:                       return "OFF";
    }
}

StderrLogger::StderrLogger(log_level minLevel, std::FILE* stream)
    : minLevel_(minLevel), stream_(stream) {}

std::string StderrLogger::formatLine(log_level level, std::string_view message) {
    std::string line = formatTimestamp();
    line += ' ';
    line += levelName(level);
    line += ' ';
    line += message;
    return line;
}

kcenon::common::VoidResult StderrLogger::log(log_level level,
                                             const std::string& message) {
    if (!is_enabled(level)) {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }
    auto line = formatLine(level, message);
    line += '\n';

    std::lock_guard lock(mutex_);
    std::fwrite(line.data(), 1, line.size(), stream_);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult StderrLogger::log(
    log_level level, std::string_view message,
    const kcenon::common::interfaces::source_location& /*loc*/) {
    return log(level, std::string(message));
}

kcenon::common::VoidResult StderrLogger::log(
    const kcenon::common::interfaces::log_entry& entry) {
    return log(entry.level, entry.message);
}

bool StderrLogger::is_enabled(log_level level) const {
    return level != log_level::off &&
           level >= minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult StderrLogger::set_level(log_level level) {
    minLevel_.store(level, std::memory_order_release);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

StderrLogger::log_level StderrLogger::get_level() const {
    return minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult StderrLogger::flush() {
    std::lock_guard lock(mutex_);
    std::fflush(stream_);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

} // namespace gnb::foundation
