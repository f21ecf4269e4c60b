#pragma once

/// @file guest_types.hpp
/// @brief Configuration and request types for the guest agent.

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "gnb/protocol/messages.hpp"
#include "gnb/version.hpp"

namespace gnb::service {

/// Version of the Desktop Notifications specification implemented.
inline constexpr const char* kNotificationSpecVersion = "1.2";

/// Configuration for the guest side of the bridge.
struct GuestConfig {
    std::string serverName = "Guest Notification Bridge";
    std::string serverVendor = "gnb";
    std::string serverVersion = GNB_VERSION_STRING;

    /// Returned from GetCapabilities.
    std::vector<std::string> capabilities = {"actions", "persistence"};

    /// Largest frame accepted from the host.
    uint32_t maxMessageSize = protocol::kMaxMessageSize;
};

/// Hint value whose D-Bus type the agent does not decode.
struct UnsupportedHint {
    std::string signature;

    bool operator==(const UnsupportedHint&) const = default;
};

/// Decoded value of one entry of the Notify "hints" dictionary.
using HintValue = std::variant<bool,
                               uint8_t,
                               int32_t,
                               uint32_t,
                               std::string,
                               protocol::ImageParameters,
                               UnsupportedHint>;

using HintMap = std::map<std::string, HintValue>;

/// Arguments of one org.freedesktop.Notifications.Notify call.
struct NotifyRequest {
    std::string appName;
    uint32_t replacesId = 0;
    std::string appIcon;
    std::string summary;
    std::string body;
    std::vector<std::string> actions;
    HintMap hints;
    int32_t expireTimeout = -1;
};

} // namespace gnb::service
