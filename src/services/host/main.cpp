/// @file main.cpp
/// @brief Host daemon entry point.
///
/// Spawned with stdin/stdout connected to a guest agent. Forwards the
/// guest's notifications to the host session bus and relays the server's
/// signals back.

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/foundation/config_manager.hpp"
#include "gnb/protocol/frame_channel.hpp"
#include "gnb/protocol/handshake.hpp"
#include "gnb/service/bus_loop.hpp"
#include "gnb/service/host_bridge.hpp"
#include "gnb/service/host_types.hpp"
#include "gnb/service/notification_emitter.hpp"
#include "gnb/service/sdbus_notification_backend.hpp"
#include "gnb/service/service_runner.hpp"

namespace {

using gnb::foundation::LogCategory;

std::string defaultSummaryPrefix() {
    const char* domain = std::getenv("QREXEC_REMOTE_DOMAIN");
    if (domain == nullptr || domain[0] == '\0') {
        return {};
    }
    return std::string("[") + domain + "] ";
}

gnb::foundation::BridgeResult<gnb::service::HostConfig> buildHostConfig(
    const gnb::foundation::ConfigManager& config) {
    using Result = gnb::foundation::BridgeResult<gnb::service::HostConfig>;
    gnb::service::HostConfig cfg;

    auto appName = config.getOr<std::string>("host.application_name", cfg.applicationName);
    if (!appName) {
        return Result::err(appName.error());
    }
    cfg.applicationName = std::move(appName).value();

    auto prefix = config.getOr<std::string>("host.summary_prefix", defaultSummaryPrefix());
    if (!prefix) {
        return Result::err(prefix.error());
    }
    cfg.summaryPrefix = std::move(prefix).value();

    auto forwardImages = config.getOr<bool>("host.forward_images", cfg.forwardImages);
    if (!forwardImages) {
        return Result::err(forwardImages.error());
    }
    cfg.forwardImages = forwardImages.value();

    auto timeout = config.getOr<int>("host.call_timeout_ms",
                                     static_cast<int>(cfg.callTimeout.count()));
    if (!timeout) {
        return Result::err(timeout.error());
    }
    if (timeout.value() <= 0) {
        return Result::err(gnb::foundation::BridgeError(
            gnb::foundation::ErrorCode::InvalidArgument,
            "host.call_timeout_ms must be positive"));
    }
    cfg.callTimeout = std::chrono::milliseconds(timeout.value());

    auto maxSize = config.getOr<uint32_t>("protocol.max_message_size", cfg.maxMessageSize);
    if (!maxSize) {
        return Result::err(maxSize.error());
    }
    cfg.maxMessageSize = std::min(maxSize.value(), gnb::protocol::kMaxMessageSize);

    return Result::ok(std::move(cfg));
}

void logStats(const gnb::service::HostBridgeStats& stats) {
    GNB_LOG_INFO(LogCategory::Host,
                 "frames=" + std::to_string(stats.framesReceived) +
                 " forwarded=" + std::to_string(stats.notificationsForwarded) +
                 " rejected=" + std::to_string(stats.notificationsRejected) +
                 " closes=" + std::to_string(stats.closeRequests) +
                 " events=" + std::to_string(stats.eventsSent));
}

int fail(std::string_view what, const gnb::foundation::BridgeError& error) {
    GNB_LOG_ERROR(LogCategory::Host, std::string(what) + ": " + std::string(error.message()));
    (void)gnb::foundation::BridgeLogger::instance().flush();
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char* argv[]) {
    gnb::service::SignalHandler signals;
    gnb::service::initLogging();

    auto source = gnb::service::resolveConfigSource(
        gnb::service::parseConfigArg(argc, argv), "/etc/gnb/gnb-host-daemon.yaml");

    gnb::foundation::ConfigManager config;
    if (auto loaded = gnb::service::loadConfig(config, source); !loaded) {
        return fail("failed to load config", loaded.error());
    }
    if (auto applied = gnb::service::applyLoggingConfig(config); !applied) {
        return fail("invalid logging config", applied.error());
    }

    auto hostConfig = buildHostConfig(config);
    if (!hostConfig) {
        return fail("invalid host config", hostConfig.error());
    }
    const auto maxMessageSize = hostConfig.value().maxMessageSize;

    auto backend = gnb::service::SdBusNotificationBackend::connect(hostConfig.value().callTimeout);
    if (!backend) {
        return fail("cannot connect to the notification server", backend.error());
    }

    gnb::service::NotificationEmitter emitter(*backend.value(), std::move(hostConfig).value());
    if (auto initialized = emitter.initialize(); !initialized) {
        return fail("cannot query the notification server", initialized.error());
    }

    auto version = gnb::protocol::hostHandshake(STDIN_FILENO, STDOUT_FILENO);
    if (!version) {
        return fail("handshake failed", version.error());
    }

    gnb::protocol::FdFrameWriter writer(STDOUT_FILENO);
    gnb::service::HostBridge bridge(emitter, writer);
    bridge.start();

    gnb::protocol::FrameDecoder decoder(maxMessageSize);
    gnb::service::BusLoop loop(backend.value()->bus(), STDIN_FILENO, signals);

    auto outcome = loop.run(
        [&]() -> gnb::foundation::BridgeResult<bool> {
            auto more = gnb::protocol::readAvailable(STDIN_FILENO, decoder);
            if (!more) {
                return more;
            }
            if (auto handled = bridge.processFrames(decoder); !handled) {
                return gnb::foundation::BridgeResult<bool>::err(handled.error());
            }
            if (!more.value() && decoder.buffered() != 0) {
                return gnb::foundation::BridgeResult<bool>::err(gnb::foundation::BridgeError(
                    gnb::foundation::ErrorCode::TruncatedMessage,
                    "guest closed the channel in the middle of a frame"));
            }
            return more;
        },
        [&]() { return bridge.health(); });

    logStats(bridge.stats());
    if (!outcome) {
        return fail("bridge stopped", outcome.error());
    }
    (void)gnb::foundation::BridgeLogger::instance().flush();
    return EXIT_SUCCESS;
}
