#pragma once

/// @file sdbus_notification_backend.hpp
/// @brief NotificationBackend on the host session bus via sd-bus.

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "gnb/service/notification_backend.hpp"
#include "gnb/service/sdbus_support.hpp"

namespace gnb::service {

/// Client of org.freedesktop.Notifications on the user session bus.
///
/// Method calls block for at most the configured timeout. Server signals
/// are delivered through signals() while the owner's event loop calls
/// sd_bus_process() on bus().
class SdBusNotificationBackend : public NotificationBackend {
    struct PrivateTag {};

public:
    /// Open the session bus and subscribe to the server's signals.
    static BridgeResult<std::unique_ptr<SdBusNotificationBackend>> connect(
        std::chrono::milliseconds callTimeout);

    SdBusNotificationBackend(PrivateTag, SdBusPtr bus, std::chrono::milliseconds callTimeout);
    ~SdBusNotificationBackend() override;

    SdBusNotificationBackend(const SdBusNotificationBackend&) = delete;
    SdBusNotificationBackend& operator=(const SdBusNotificationBackend&) = delete;

    BridgeResult<std::vector<std::string>> getCapabilities() override;
    BridgeResult<uint32_t> notify(const NotifyCall& call) override;
    BridgeResult<void> closeNotification(uint32_t id) override;
    BackendSignals& signals() noexcept override { return signals_; }

    [[nodiscard]] sd_bus* bus() const noexcept { return bus_.get(); }

private:
    BridgeResult<void> subscribe();
    BridgeResult<SdBusMessagePtr> newCall(const char* member);
    BridgeResult<SdBusMessagePtr> call(sd_bus_message* message, const char* member);

    static int onNotificationClosed(sd_bus_message* m, void* userdata, sd_bus_error* err);
    static int onActionInvoked(sd_bus_message* m, void* userdata, sd_bus_error* err);
    static int onNotificationReplied(sd_bus_message* m, void* userdata, sd_bus_error* err);
    static int onNameOwnerChanged(sd_bus_message* m, void* userdata, sd_bus_error* err);

    SdBusPtr bus_;
    std::chrono::milliseconds callTimeout_;
    BackendSignals signals_;
    std::vector<SdBusSlotPtr> slots_;
};

} // namespace gnb::service
