#pragma once

/// @file host_types.hpp
/// @brief Configuration and statistics types for the host daemon.

#include <chrono>
#include <cstdint>
#include <string>

#include "gnb/protocol/messages.hpp"

namespace gnb::service {

/// Configuration for the host side of the bridge.
struct HostConfig {
    /// Application name passed to the host notification server.
    std::string applicationName = "Guest Notification Bridge";

    /// Prepended to every (sanitized) summary, typically "[guest-name] ".
    std::string summaryPrefix;

    /// Forward validated image-data hints. Off by default because the
    /// host server's image decoder is then exposed to guest data.
    bool forwardImages = false;

    /// Timeout for each method call on the host session bus.
    std::chrono::milliseconds callTimeout{25000};

    /// Largest frame accepted from the guest; capped at kMaxMessageSize.
    uint32_t maxMessageSize = protocol::kMaxMessageSize;
};

/// Counters reported when the daemon exits.
struct HostBridgeStats {
    uint64_t framesReceived = 0;
    uint64_t notificationsForwarded = 0;
    uint64_t notificationsRejected = 0;
    uint64_t closeRequests = 0;
    uint64_t eventsSent = 0;
};

} // namespace gnb::service
