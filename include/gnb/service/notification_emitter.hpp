#pragma once

/// @file notification_emitter.hpp
/// @brief Forwards sanitized guest notifications to the host server.
///
/// NotificationEmitter is the trust boundary of the host daemon: it takes
/// a protocol::Notification straight off the wire, validates and sanitizes
/// every field, translates guest IDs to host IDs, and calls the host
/// notification server. Server signals are translated back into guest IDs
/// and published through the on*() signals.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "gnb/foundation/bridge_result.hpp"
#include "gnb/foundation/signal.hpp"
#include "gnb/foundation/types.hpp"
#include "gnb/protocol/messages.hpp"
#include "gnb/service/capabilities.hpp"
#include "gnb/service/host_types.hpp"
#include "gnb/service/notification_backend.hpp"

namespace gnb::service {

using foundation::GuestId;

class NotificationEmitter {
public:
    /// @param backend Must outlive the emitter.
    NotificationEmitter(NotificationBackend& backend, HostConfig config);
    ~NotificationEmitter();

    NotificationEmitter(const NotificationEmitter&) = delete;
    NotificationEmitter& operator=(const NotificationEmitter&) = delete;

    /// Query server capabilities and subscribe to server signals.
    BridgeResult<void> initialize();

    [[nodiscard]] Capabilities capabilities() const;

    /// Validate, sanitize and forward one notification.
    ///
    /// Fails with UnknownNotificationId for an unknown replaces ID,
    /// InvalidTimeout for an expire timeout below -1, OddActionList,
    /// InvalidActionName, InvalidCategory or InvalidImage for malformed
    /// fields, and with the backend's error if the call itself fails.
    /// @return The guest-visible ID of the notification.
    BridgeResult<GuestId> sendNotification(protocol::Notification untrusted);

    /// Close a notification on behalf of the guest.
    BridgeResult<void> closeNotification(GuestId id);

    /// Map a host ID from a server signal to the guest ID it backs.
    [[nodiscard]] std::optional<GuestId> translateHostId(HostId id) const;

    /// Like translateHostId(), and forget the mapping.
    std::optional<GuestId> removeHostId(HostId id);

    /// Forget every mapping.
    void clear();

    /// Number of notifications currently mapped.
    [[nodiscard]] std::size_t activeCount() const;

    // -- Events (guest IDs) ------------------------------------------------

    /// A notification was closed by the server (id, reason).
    foundation::Signal<GuestId, uint32_t>& onDismissed();

    foundation::Signal<GuestId, std::string>& onActionInvoked();

    foundation::Signal<GuestId, std::string>& onReplied();

    /// The host server was replaced; all IDs were invalidated.
    foundation::Signal<>& onServerRestart();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gnb::service
