/// @file sdbus_notification_backend.cpp
/// @brief SdBusNotificationBackend implementation.

#include "gnb/service/sdbus_notification_backend.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/service/sdbus_marshal.hpp"

namespace gnb::service {

using foundation::BridgeError;
using foundation::ErrorCode;
using foundation::HostId;
using foundation::LogCategory;

namespace {

constexpr const char* kOwnerChangedMatch =
    "type='signal',"
    "sender='org.freedesktop.DBus',"
    "path='/org/freedesktop/DBus',"
    "interface='org.freedesktop.DBus',"
    "member='NameOwnerChanged',"
    "arg0='org.freedesktop.Notifications'";

SdBusNotificationBackend* self(void* userdata) {
    return static_cast<SdBusNotificationBackend*>(userdata);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

SdBusNotificationBackend::SdBusNotificationBackend(PrivateTag, SdBusPtr bus,
                                                   std::chrono::milliseconds callTimeout)
    : bus_(std::move(bus)), callTimeout_(callTimeout) {}

SdBusNotificationBackend::~SdBusNotificationBackend() {
    // Slots must be released before the bus they belong to.
    slots_.clear();
}

BridgeResult<std::unique_ptr<SdBusNotificationBackend>> SdBusNotificationBackend::connect(
    std::chrono::milliseconds callTimeout) {
    using Out = BridgeResult<std::unique_ptr<SdBusNotificationBackend>>;

    sd_bus* raw = nullptr;
    int r = sd_bus_open_user(&raw);
    if (r < 0) {
        return Out::err(busError(ErrorCode::BusConnectionFailed,
                                 "cannot connect to the session bus", r));
    }

    auto backend =
        std::make_unique<SdBusNotificationBackend>(PrivateTag{}, SdBusPtr(raw), callTimeout);
    auto subscribed = backend->subscribe();
    if (subscribed.hasError()) {
        return Out::err(subscribed.error());
    }
    return Out::ok(std::move(backend));
}

BridgeResult<void> SdBusNotificationBackend::subscribe() {
    struct Match {
        const char* member;
        sd_bus_message_handler_t handler;
    };
    const Match matches[] = {
        {"NotificationClosed", &SdBusNotificationBackend::onNotificationClosed},
        {"ActionInvoked", &SdBusNotificationBackend::onActionInvoked},
        {"NotificationReplied", &SdBusNotificationBackend::onNotificationReplied},
    };

    for (const auto& match : matches) {
        sd_bus_slot* slot = nullptr;
        int r = sd_bus_match_signal(bus_.get(), &slot, kNotificationsName,
                                    kNotificationsPath, kNotificationsInterface,
                                    match.member, match.handler, this);
        if (r < 0) {
            return BridgeResult<void>::err(busError(
                ErrorCode::MatchFailed,
                std::string("cannot subscribe to ") + match.member, r));
        }
        slots_.emplace_back(slot);
    }

    sd_bus_slot* slot = nullptr;
    int r = sd_bus_add_match(bus_.get(), &slot, kOwnerChangedMatch,
                             &SdBusNotificationBackend::onNameOwnerChanged, this);
    if (r < 0) {
        return BridgeResult<void>::err(
            busError(ErrorCode::MatchFailed, "cannot subscribe to NameOwnerChanged", r));
    }
    slots_.emplace_back(slot);
    return BridgeResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Method calls
// ---------------------------------------------------------------------------

BridgeResult<SdBusMessagePtr> SdBusNotificationBackend::newCall(const char* member) {
    sd_bus_message* raw = nullptr;
    int r = sd_bus_message_new_method_call(bus_.get(), &raw, kNotificationsName,
                                           kNotificationsPath, kNotificationsInterface,
                                           member);
    if (r < 0) {
        return BridgeResult<SdBusMessagePtr>::err(busError(
            ErrorCode::MethodCallFailed, std::string("cannot create ") + member + " call", r));
    }
    return BridgeResult<SdBusMessagePtr>::ok(SdBusMessagePtr(raw));
}

BridgeResult<SdBusMessagePtr> SdBusNotificationBackend::call(sd_bus_message* message,
                                                             const char* member) {
    ScopedBusError error;
    sd_bus_message* reply = nullptr;
    auto usec = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(callTimeout_).count());
    int r = sd_bus_call(bus_.get(), message, usec, error.get(), &reply);
    if (r < 0) {
        GNB_LOG_DEBUG(LogCategory::DBus, std::string(member) + " call failed");
        return BridgeResult<SdBusMessagePtr>::err(busError(
            ErrorCode::MethodCallFailed, std::string(member) + " call failed", r,
            error.get()));
    }
    return BridgeResult<SdBusMessagePtr>::ok(SdBusMessagePtr(reply));
}

BridgeResult<std::vector<std::string>> SdBusNotificationBackend::getCapabilities() {
    using Out = BridgeResult<std::vector<std::string>>;

    auto message = newCall("GetCapabilities");
    if (message.hasError()) {
        return Out::err(message.error());
    }
    auto reply = call(message.value().get(), "GetCapabilities");
    if (reply.hasError()) {
        return Out::err(reply.error());
    }

    std::vector<std::string> caps;
    int r = readStrv(reply.value().get(), caps);
    if (r < 0) {
        return Out::err(busError(ErrorCode::InvalidReply,
                                 "malformed GetCapabilities reply", r));
    }
    return Out::ok(std::move(caps));
}

BridgeResult<uint32_t> SdBusNotificationBackend::notify(const NotifyCall& c) {
    using Out = BridgeResult<uint32_t>;

    auto message = newCall("Notify");
    if (message.hasError()) {
        return Out::err(message.error());
    }
    sd_bus_message* m = message.value().get();

    int r = appendNotifyCall(m, c);
    if (r < 0) {
        return Out::err(busError(ErrorCode::MethodCallFailed,
                                 "cannot build Notify call", r));
    }

    auto reply = call(m, "Notify");
    if (reply.hasError()) {
        return Out::err(reply.error());
    }

    uint32_t id = 0;
    r = sd_bus_message_read(reply.value().get(), "u", &id);
    if (r < 0) {
        return Out::err(busError(ErrorCode::InvalidReply, "malformed Notify reply", r));
    }
    return Out::ok(id);
}

BridgeResult<void> SdBusNotificationBackend::closeNotification(uint32_t id) {
    auto message = newCall("CloseNotification");
    if (message.hasError()) {
        return BridgeResult<void>::err(message.error());
    }
    int r = sd_bus_message_append(message.value().get(), "u", id);
    if (r < 0) {
        return BridgeResult<void>::err(busError(ErrorCode::MethodCallFailed,
                                                "cannot build CloseNotification call", r));
    }
    auto reply = call(message.value().get(), "CloseNotification");
    if (reply.hasError()) {
        return BridgeResult<void>::err(reply.error());
    }
    return BridgeResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Signal callbacks
// ---------------------------------------------------------------------------

int SdBusNotificationBackend::onNotificationClosed(sd_bus_message* m, void* userdata,
                                                   sd_bus_error* /*err*/) {
    uint32_t id = 0;
    uint32_t reason = 0;
    if (sd_bus_message_read(m, "uu", &id, &reason) < 0) {
        GNB_LOG_WARN(LogCategory::DBus, "malformed NotificationClosed signal ignored");
        return 0;
    }
    if (id == 0) {
        return 0;
    }
    self(userdata)->signals_.closed.emit(HostId(id), reason);
    return 0;
}

int SdBusNotificationBackend::onActionInvoked(sd_bus_message* m, void* userdata,
                                              sd_bus_error* /*err*/) {
    uint32_t id = 0;
    const char* action = nullptr;
    if (sd_bus_message_read(m, "us", &id, &action) < 0) {
        GNB_LOG_WARN(LogCategory::DBus, "malformed ActionInvoked signal ignored");
        return 0;
    }
    if (id == 0) {
        return 0;
    }
    self(userdata)->signals_.actionInvoked.emit(HostId(id), std::string(action));
    return 0;
}

int SdBusNotificationBackend::onNotificationReplied(sd_bus_message* m, void* userdata,
                                                    sd_bus_error* /*err*/) {
    uint32_t id = 0;
    const char* text = nullptr;
    if (sd_bus_message_read(m, "us", &id, &text) < 0) {
        GNB_LOG_WARN(LogCategory::DBus, "malformed NotificationReplied signal ignored");
        return 0;
    }
    if (id == 0) {
        return 0;
    }
    self(userdata)->signals_.replied.emit(HostId(id), std::string(text));
    return 0;
}

int SdBusNotificationBackend::onNameOwnerChanged(sd_bus_message* m, void* userdata,
                                                 sd_bus_error* /*err*/) {
    const char* name = nullptr;
    const char* oldOwner = nullptr;
    const char* newOwner = nullptr;
    if (sd_bus_message_read(m, "sss", &name, &oldOwner, &newOwner) < 0) {
        GNB_LOG_WARN(LogCategory::DBus, "malformed NameOwnerChanged signal ignored");
        return 0;
    }
    if (newOwner == nullptr || newOwner[0] == '\0') {
        GNB_LOG_WARN(LogCategory::DBus, "notification server left the bus");
        return 0;
    }
    GNB_LOG_INFO(LogCategory::DBus,
                 std::string("notification server is now owned by ") + newOwner);
    self(userdata)->signals_.ownerChanged.emit();
    return 0;
}

} // namespace gnb::service
