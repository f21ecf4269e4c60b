/// @file main.cpp
/// @brief Guest agent entry point.
///
/// Owns org.freedesktop.Notifications on the guest session bus and
/// forwards every call over stdin/stdout to a host daemon.

#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/foundation/config_manager.hpp"
#include "gnb/protocol/frame_channel.hpp"
#include "gnb/protocol/handshake.hpp"
#include "gnb/service/bus_loop.hpp"
#include "gnb/service/guest_agent.hpp"
#include "gnb/service/guest_types.hpp"
#include "gnb/service/notification_service.hpp"
#include "gnb/service/service_runner.hpp"

namespace {

using gnb::foundation::LogCategory;

gnb::foundation::BridgeResult<gnb::service::GuestConfig> buildGuestConfig(
    const gnb::foundation::ConfigManager& config) {
    using Result = gnb::foundation::BridgeResult<gnb::service::GuestConfig>;
    gnb::service::GuestConfig cfg;

    auto name = config.getOr<std::string>("guest.server_name", cfg.serverName);
    if (!name) {
        return Result::err(name.error());
    }
    cfg.serverName = std::move(name).value();

    auto vendor = config.getOr<std::string>("guest.server_vendor", cfg.serverVendor);
    if (!vendor) {
        return Result::err(vendor.error());
    }
    cfg.serverVendor = std::move(vendor).value();

    auto version = config.getOr<std::string>("guest.server_version", cfg.serverVersion);
    if (!version) {
        return Result::err(version.error());
    }
    cfg.serverVersion = std::move(version).value();

    auto caps = config.getOr<std::vector<std::string>>("guest.capabilities", cfg.capabilities);
    if (!caps) {
        return Result::err(caps.error());
    }
    cfg.capabilities = std::move(caps).value();

    auto maxSize = config.getOr<uint32_t>("protocol.max_message_size", cfg.maxMessageSize);
    if (!maxSize) {
        return Result::err(maxSize.error());
    }
    cfg.maxMessageSize = std::min(maxSize.value(), gnb::protocol::kMaxMessageSize);

    return Result::ok(std::move(cfg));
}

int fail(std::string_view what, const gnb::foundation::BridgeError& error) {
    GNB_LOG_ERROR(LogCategory::Guest, std::string(what) + ": " + std::string(error.message()));
    (void)gnb::foundation::BridgeLogger::instance().flush();
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char* argv[]) {
    gnb::service::SignalHandler signals;
    gnb::service::initLogging();

    auto source = gnb::service::resolveConfigSource(
        gnb::service::parseConfigArg(argc, argv), "/etc/gnb/gnb-guest-agent.yaml");

    gnb::foundation::ConfigManager config;
    if (auto loaded = gnb::service::loadConfig(config, source); !loaded) {
        return fail("failed to load config", loaded.error());
    }
    if (auto applied = gnb::service::applyLoggingConfig(config); !applied) {
        return fail("invalid logging config", applied.error());
    }

    auto guestConfig = buildGuestConfig(config);
    if (!guestConfig) {
        return fail("invalid guest config", guestConfig.error());
    }
    const auto maxMessageSize = guestConfig.value().maxMessageSize;

    auto version = gnb::protocol::guestHandshake(STDIN_FILENO, STDOUT_FILENO);
    if (!version) {
        return fail("handshake failed", version.error());
    }

    auto service = gnb::service::NotificationService::connect(std::move(guestConfig).value());
    if (!service) {
        return fail("cannot connect to the session bus", service.error());
    }

    gnb::protocol::FdFrameWriter writer(STDOUT_FILENO);
    gnb::service::GuestAgent agent(writer, *service.value());
    if (auto started = service.value()->start(agent); !started) {
        return fail("cannot serve org.freedesktop.Notifications", started.error());
    }

    gnb::protocol::FrameDecoder decoder(maxMessageSize);
    gnb::service::BusLoop loop(service.value()->bus(), STDIN_FILENO, signals);

    auto outcome = loop.run(
        [&]() -> gnb::foundation::BridgeResult<bool> {
            auto more = gnb::protocol::readAvailable(STDIN_FILENO, decoder);
            if (!more) {
                return more;
            }
            if (auto handled = agent.processFrames(decoder); !handled) {
                return gnb::foundation::BridgeResult<bool>::err(handled.error());
            }
            if (!more.value()) {
                agent.failPending(gnb::foundation::BridgeError(
                    gnb::foundation::ErrorCode::ChannelClosed, "host daemon went away"));
            }
            return more;
        },
        [] { return gnb::foundation::BridgeResult<void>::ok(); });

    if (!outcome) {
        agent.failPending(outcome.error());
        return fail("agent stopped", outcome.error());
    }
    (void)gnb::foundation::BridgeLogger::instance().flush();
    return EXIT_SUCCESS;
}
