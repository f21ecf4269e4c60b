/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "gnb/service/service_runner.hpp"

#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <system_error>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "gnb/foundation/stderr_logger.hpp"

namespace gnb::service {

using foundation::BridgeError;
using foundation::BridgeResult;
using foundation::ErrorCode;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGPIPE, SIG_IGN);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

SignalHandler::~SignalHandler() {
    // Restore default handlers so that a second signal terminates immediately.
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- Config loading ----------------------------------------------------------

ConfigSource resolveConfigSource(const std::filesystem::path& cliPath,
                                 const std::filesystem::path& defaultPath) {
    if (!cliPath.empty()) {
        return {cliPath, true};
    }
    const char* envPath = std::getenv("GNB_CONFIG_PATH");
    if (envPath != nullptr && envPath[0] != '\0') {
        return {envPath, true};
    }
    return {defaultPath, false};
}

BridgeResult<void> loadConfig(foundation::ConfigManager& config, const ConfigSource& source) {
    if (!source.isExplicit) {
        std::error_code ec;
        if (!std::filesystem::exists(source.path, ec)) {
            GNB_LOG_INFO(foundation::LogCategory::Core,
                         "no config file at " + source.path.string() + ", using defaults");
            return BridgeResult<void>::ok();
        }
    }
    auto loaded = config.load(source.path);
    if (loaded.hasValue()) {
        GNB_LOG_INFO(foundation::LogCategory::Core,
                     "loaded config from " + source.path.string());
    }
    return loaded;
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

// -- Logging -----------------------------------------------------------------

void initLogging() {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    registry.set_default_logger(std::make_shared<foundation::StderrLogger>(
        kcenon::common::interfaces::log_level::trace));
}

BridgeResult<void> applyLoggingConfig(const foundation::ConfigManager& config) {
    auto levelName = config.getOr<std::string>("logging.level", "");
    if (levelName.hasError()) {
        return BridgeResult<void>::err(levelName.error());
    }
    if (levelName.value().empty()) {
        return BridgeResult<void>::ok();
    }
    auto level = foundation::parseLogLevel(levelName.value());
    if (!level) {
        return BridgeResult<void>::err(BridgeError(
            ErrorCode::InvalidArgument, "unknown log level: " + levelName.value()));
    }
    foundation::BridgeLogger::instance().setLevel(*level);
    return BridgeResult<void>::ok();
}

} // namespace gnb::service
