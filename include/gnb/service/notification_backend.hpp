#pragma once

/// @file notification_backend.hpp
/// @brief Abstract client of an org.freedesktop.Notifications server.
///
/// The emitter talks to the host notification server only through this
/// interface. SdBusNotificationBackend implements it on the session bus;
/// tests substitute an in-memory fake.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gnb/foundation/bridge_result.hpp"
#include "gnb/foundation/signal.hpp"
#include "gnb/foundation/types.hpp"
#include "gnb/sanitize/notification_validator.hpp"

namespace gnb::service {

using foundation::BridgeResult;
using foundation::HostId;

/// Hints sent with a Notify call. Only set hints are transmitted.
struct NotifyHints {
    std::optional<uint8_t> urgency;
    bool resident = false;
    bool suppressSound = false;
    bool transient = false;
    std::optional<std::string> category;
    std::optional<sanitize::ValidatedImage> image;

    bool operator==(const NotifyHints&) const = default;
};

/// Arguments of org.freedesktop.Notifications.Notify, already sanitized.
struct NotifyCall {
    std::string appName;
    uint32_t replacesId = 0;
    std::string appIcon;
    std::string summary;
    std::string body;
    std::vector<std::string> actions;
    NotifyHints hints;
    int32_t expireTimeout = -1;

    bool operator==(const NotifyCall&) const = default;
};

/// Signals received from the notification server.
struct BackendSignals {
    /// NotificationClosed(id, reason).
    foundation::Signal<HostId, uint32_t> closed;

    /// ActionInvoked(id, action_key).
    foundation::Signal<HostId, std::string> actionInvoked;

    /// NotificationReplied(id, text), KDE extension.
    foundation::Signal<HostId, std::string> replied;

    /// The server's bus name got a new owner (server restarted).
    foundation::Signal<> ownerChanged;
};

class NotificationBackend {
public:
    virtual ~NotificationBackend() = default;

    virtual BridgeResult<std::vector<std::string>> getCapabilities() = 0;

    /// @return The server-assigned ID. A D-Bus error reply is reported as
    ///         MethodCallFailed with a DBusErrorInfo context.
    virtual BridgeResult<uint32_t> notify(const NotifyCall& call) = 0;

    virtual BridgeResult<void> closeNotification(uint32_t id) = 0;

    virtual BackendSignals& signals() noexcept = 0;
};

} // namespace gnb::service
