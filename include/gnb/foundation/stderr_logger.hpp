#pragma once

/// @file stderr_logger.hpp
/// @brief kcenon ILogger implementation writing plain text lines to stderr.
///
/// Both bridge executables speak the wire protocol over stdout, so every
/// diagnostic must go to stderr. Each record is written as a single line:
///
///   2026-01-01T12:00:00.000Z WARNING [Sanitizer] invalid category refused
///
/// The output stream is injectable so tests can capture the lines.

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace gnb::foundation {

class StderrLogger : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    explicit StderrLogger(log_level minLevel = log_level::info,
                          std::FILE* stream = stderr);

    kcenon::common::VoidResult log(log_level level,
                                   const std::string& message) override;

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(log_level level) const override;

    kcenon::common::VoidResult set_level(log_level level) override;

    log_level get_level() const override;

    kcenon::common::VoidResult flush() override;

    /// Format one output line without the trailing newline.
    static std::string formatLine(log_level level, std::string_view message);

private:
    std::atomic<log_level> minLevel_;
    std::FILE* stream_;
    std::mutex mutex_;
};

} // namespace gnb::foundation
