#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the bridge entry points.
///
/// Provides signal handling, configuration path resolution and loading,
/// CLI argument parsing, and logger setup for both executables.

#include <atomic>
#include <filesystem>
#include <string_view>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/foundation/bridge_result.hpp"
#include "gnb/foundation/config_manager.hpp"

namespace gnb::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic). SIGPIPE is ignored so
/// that a vanished peer surfaces as EPIPE from write().
///
/// The original default handlers are restored on destruction so that a
/// second signal during teardown terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Set the flag as if a signal had arrived.
    void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Where configuration is read from.
struct ConfigSource {
    std::filesystem::path path;

    /// Given with --config or GNB_CONFIG_PATH. A missing explicit file is
    /// an error; a missing built-in default is not.
    bool isExplicit = false;
};

/// Resolve the configuration file:
///   1. @p cliPath (from --config) if not empty
///   2. GNB_CONFIG_PATH environment variable, if set
///   3. @p defaultPath
[[nodiscard]] ConfigSource resolveConfigSource(const std::filesystem::path& cliPath,
                                               const std::filesystem::path& defaultPath);

/// Load the resolved configuration file into @p config.
/// @return Success (also when an implicit default is absent) or
///         ConfigLoadFailed.
[[nodiscard]] foundation::BridgeResult<void> loadConfig(foundation::ConfigManager& config,
                                                        const ConfigSource& source);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Register a StderrLogger as the process-wide default logger.
void initLogging();

/// Apply "logging.level" from @p config to every log category.
/// @return ConfigTypeMismatch or InvalidArgument for a bad value.
[[nodiscard]] foundation::BridgeResult<void> applyLoggingConfig(
    const foundation::ConfigManager& config);

} // namespace gnb::service
