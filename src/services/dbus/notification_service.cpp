/// @file notification_service.cpp
/// @brief NotificationService implementation.

#include "gnb/service/notification_service.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/service/sdbus_marshal.hpp"

namespace gnb::service {

using foundation::BridgeError;
using foundation::DBusErrorInfo;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

/// Send a deferred error reply, falling back to Failed if the host sent
/// a name sd-bus refuses.
void replyError(sd_bus_message* call, const BridgeError& error) {
    std::string name(foundation::DBusErrorName::Failed);
    if (const auto* info = error.context<DBusErrorInfo>()) {
        name = info->name;
    }
    std::string message(error.message());
    int r = sd_bus_reply_method_errorf(call, name.c_str(), "%s", message.c_str());
    if (r < 0 && name != foundation::DBusErrorName::Failed) {
        r = sd_bus_reply_method_errorf(
            call, std::string(foundation::DBusErrorName::Failed).c_str(), "%s",
            message.c_str());
    }
    if (r < 0) {
        GNB_LOG_WARN(LogCategory::DBus, "cannot send Notify error reply");
    }
}

NotificationService* self(void* userdata) {
    return static_cast<NotificationService*>(userdata);
}

} // namespace

// ---------------------------------------------------------------------------
// Vtable
// ---------------------------------------------------------------------------

const sd_bus_vtable NotificationService::vtable_[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_METHOD("GetCapabilities", "", "as",
                  &NotificationService::methodGetCapabilities,
                  SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("Notify", "susssasa{sv}i", "u",
                  &NotificationService::methodNotify,
                  SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("CloseNotification", "u", "",
                  &NotificationService::methodCloseNotification,
                  SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("GetServerInformation", "", "ssss",
                  &NotificationService::methodGetServerInformation,
                  SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_SIGNAL("NotificationClosed", "uu", 0),
    SD_BUS_SIGNAL("ActionInvoked", "us", 0),
    SD_BUS_SIGNAL("NotificationReplied", "us", 0),
    SD_BUS_VTABLE_END
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

NotificationService::NotificationService(PrivateTag, SdBusPtr bus, GuestConfig config)
    : bus_(std::move(bus)), config_(std::move(config)) {}

NotificationService::~NotificationService() {
    objectSlot_.reset();
}

BridgeResult<std::unique_ptr<NotificationService>> NotificationService::connect(
    GuestConfig config) {
    using Out = BridgeResult<std::unique_ptr<NotificationService>>;

    sd_bus* raw = nullptr;
    int r = sd_bus_open_user(&raw);
    if (r < 0) {
        return Out::err(busError(ErrorCode::BusConnectionFailed,
                                 "cannot connect to the session bus", r));
    }
    return Out::ok(
        std::make_unique<NotificationService>(PrivateTag{}, SdBusPtr(raw), std::move(config)));
}

BridgeResult<void> NotificationService::start(GuestAgent& agent) {
    agent_ = &agent;

    sd_bus_slot* slot = nullptr;
    int r = sd_bus_add_object_vtable(bus_.get(), &slot, kNotificationsPath,
                                     kNotificationsInterface, vtable_, this);
    if (r < 0) {
        return BridgeResult<void>::err(busError(ErrorCode::ObjectRegistrationFailed,
                                                "cannot register notification object", r));
    }
    objectSlot_.reset(slot);

    r = sd_bus_request_name(bus_.get(), kNotificationsName, 0);
    if (r < 0) {
        return BridgeResult<void>::err(busError(
            ErrorCode::NameRequestFailed,
            std::string("cannot acquire ") + kNotificationsName, r));
    }
    GNB_LOG_INFO(LogCategory::DBus, std::string("acquired ") + kNotificationsName);
    return BridgeResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Methods
// ---------------------------------------------------------------------------

int NotificationService::methodGetCapabilities(sd_bus_message* m, void* userdata,
                                               sd_bus_error* /*err*/) {
    const auto& caps = self(userdata)->config_.capabilities;

    sd_bus_message* raw = nullptr;
    int r = sd_bus_message_new_method_return(m, &raw);
    if (r < 0) return r;
    SdBusMessagePtr reply(raw);

    std::vector<char*> strv;
    strv.reserve(caps.size() + 1);
    for (const auto& c : caps) {
        strv.push_back(const_cast<char*>(c.c_str()));
    }
    strv.push_back(nullptr);
    r = sd_bus_message_append_strv(reply.get(), strv.data());
    if (r < 0) return r;
    return sd_bus_send(nullptr, reply.get(), nullptr);
}

int NotificationService::methodGetServerInformation(sd_bus_message* m, void* userdata,
                                                    sd_bus_error* /*err*/) {
    const auto& cfg = self(userdata)->config_;
    return sd_bus_reply_method_return(m, "ssss", cfg.serverName.c_str(),
                                      cfg.serverVendor.c_str(), cfg.serverVersion.c_str(),
                                      kNotificationSpecVersion);
}

int NotificationService::methodNotify(sd_bus_message* m, void* userdata, sd_bus_error* err) {
    auto* service = self(userdata);

    NotifyRequest request;
    int r = readNotifyRequest(m, request);
    if (r < 0) {
        return sd_bus_error_set_errno(err, r);
    }

    // The reply is sent when the host answers; keep the call alive.
    std::shared_ptr<sd_bus_message> call(sd_bus_message_ref(m), SdBusMessageDeleter{});
    auto submitted = service->agent_->submitNotify(
        std::move(request), [call](BridgeResult<uint32_t> result) {
            if (result.hasValue()) {
                if (sd_bus_reply_method_return(call.get(), "u", result.value()) < 0) {
                    GNB_LOG_WARN(LogCategory::DBus, "cannot send Notify reply");
                }
                return;
            }
            replyError(call.get(), result.error());
        });

    if (submitted.hasError()) {
        const auto& error = submitted.error();
        std::string message(error.message());
        if (error.subsystem() == "Validation") {
            return sd_bus_error_setf(err, std::string(foundation::DBusErrorName::InvalidArgs).c_str(),
                                     "%s", message.c_str());
        }
        return sd_bus_error_setf(err, std::string(foundation::DBusErrorName::Failed).c_str(),
                                 "%s", message.c_str());
    }
    return 1;
}

int NotificationService::methodCloseNotification(sd_bus_message* m, void* userdata,
                                                 sd_bus_error* err) {
    uint32_t id = 0;
    int r = sd_bus_message_read(m, "u", &id);
    if (r < 0) {
        return sd_bus_error_set_errno(err, r);
    }
    auto sent = self(userdata)->agent_->submitClose(id);
    if (sent.hasError()) {
        std::string message(sent.error().message());
        return sd_bus_error_setf(err, std::string(foundation::DBusErrorName::Failed).c_str(),
                                 "%s", message.c_str());
    }
    return sd_bus_reply_method_return(m, "");
}

// ---------------------------------------------------------------------------
// Signals
// ---------------------------------------------------------------------------

BridgeResult<void> NotificationService::emitNotificationClosed(uint32_t id, uint32_t reason) {
    int r = sd_bus_emit_signal(bus_.get(), kNotificationsPath, kNotificationsInterface,
                               "NotificationClosed", "uu", id, reason);
    if (r < 0) {
        return BridgeResult<void>::err(
            busError(ErrorCode::SignalEmitFailed, "cannot emit NotificationClosed", r));
    }
    return BridgeResult<void>::ok();
}

BridgeResult<void> NotificationService::emitActionInvoked(uint32_t id,
                                                          const std::string& action) {
    int r = sd_bus_emit_signal(bus_.get(), kNotificationsPath, kNotificationsInterface,
                               "ActionInvoked", "us", id, action.c_str());
    if (r < 0) {
        return BridgeResult<void>::err(
            busError(ErrorCode::SignalEmitFailed, "cannot emit ActionInvoked", r));
    }
    return BridgeResult<void>::ok();
}

BridgeResult<void> NotificationService::emitNotificationReplied(uint32_t id,
                                                                const std::string& text) {
    int r = sd_bus_emit_signal(bus_.get(), kNotificationsPath, kNotificationsInterface,
                               "NotificationReplied", "us", id, text.c_str());
    if (r < 0) {
        return BridgeResult<void>::err(
            busError(ErrorCode::SignalEmitFailed, "cannot emit NotificationReplied", r));
    }
    return BridgeResult<void>::ok();
}

} // namespace gnb::service
