#pragma once

/// @file notification_service.hpp
/// @brief org.freedesktop.Notifications server on the guest session bus.

#include <memory>
#include <string>

#include "gnb/service/guest_agent.hpp"
#include "gnb/service/guest_types.hpp"
#include "gnb/service/sdbus_support.hpp"

namespace gnb::service {

/// Serves the notification interface in the guest and forwards calls to
/// a GuestAgent. Notify replies are deferred until the host answers.
class NotificationService : public GuestSignalSink {
    struct PrivateTag {};

public:
    /// Connect to the user session bus.
    static BridgeResult<std::unique_ptr<NotificationService>> connect(GuestConfig config);

    NotificationService(PrivateTag, SdBusPtr bus, GuestConfig config);
    ~NotificationService() override;

    NotificationService(const NotificationService&) = delete;
    NotificationService& operator=(const NotificationService&) = delete;

    /// Register the object, then request the well-known name.
    ///
    /// The object is registered first so that no method call can arrive
    /// for a name whose object does not exist yet.
    /// @param agent Must outlive the service.
    BridgeResult<void> start(GuestAgent& agent);

    BridgeResult<void> emitNotificationClosed(uint32_t id, uint32_t reason) override;
    BridgeResult<void> emitActionInvoked(uint32_t id, const std::string& action) override;
    BridgeResult<void> emitNotificationReplied(uint32_t id, const std::string& text) override;

    [[nodiscard]] sd_bus* bus() const noexcept { return bus_.get(); }

private:
    static int methodGetCapabilities(sd_bus_message* m, void* userdata, sd_bus_error* err);
    static int methodNotify(sd_bus_message* m, void* userdata, sd_bus_error* err);
    static int methodCloseNotification(sd_bus_message* m, void* userdata, sd_bus_error* err);
    static int methodGetServerInformation(sd_bus_message* m, void* userdata, sd_bus_error* err);

    static const sd_bus_vtable vtable_[];

    SdBusPtr bus_;
    SdBusSlotPtr objectSlot_;
    GuestConfig config_;
    GuestAgent* agent_ = nullptr;
};

} // namespace gnb::service
