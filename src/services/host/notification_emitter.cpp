/// @file notification_emitter.cpp
/// @brief NotificationEmitter implementation.

#include "gnb/service/notification_emitter.hpp"

#include <string>
#include <utility>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/sanitize/notification_validator.hpp"
#include "gnb/sanitize/text_sanitizer.hpp"
#include "gnb/service/id_maps.hpp"

namespace gnb::service {

using foundation::BridgeError;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::Signal;

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct NotificationEmitter::Impl {
    NotificationBackend& backend;
    HostConfig config;
    Capabilities caps;
    IdMaps maps;
    Signal<>::SlotId closedSlot = 0;
    Signal<>::SlotId actionSlot = 0;
    Signal<>::SlotId repliedSlot = 0;
    Signal<>::SlotId ownerSlot = 0;
    bool initialized = false;

    Signal<GuestId, uint32_t> dismissed;
    Signal<GuestId, std::string> actionInvoked;
    Signal<GuestId, std::string> replied;
    Signal<> serverRestart;

    Impl(NotificationBackend& b, HostConfig cfg)
        : backend(b), config(std::move(cfg)) {}

    BridgeResult<void> refreshCapabilities() {
        auto names = backend.getCapabilities();
        if (names.hasError()) {
            return BridgeResult<void>::err(names.error());
        }
        caps = Capabilities::parse(names.value());
        GNB_LOG_INFO(LogCategory::Host,
                     std::string("server capabilities: body markup ") +
                         (caps.has(Capability::BodyMarkup) ? "yes" : "no") +
                         ", persistence " +
                         (caps.has(Capability::Persistence) ? "yes" : "no") +
                         ", actions " + (caps.has(Capability::Actions) ? "yes" : "no"));
        return BridgeResult<void>::ok();
    }

    // -- Server signal handlers ------------------------------------------

    void handleClosed(HostId host, uint32_t reason) {
        auto guest = maps.removeHost(host);
        if (!guest) {
            GNB_LOG_DEBUG(LogCategory::Host,
                          "NotificationClosed for unmapped host ID " +
                              std::to_string(host.value()));
            return;
        }
        dismissed.emit(*guest, reason);
    }

    void handleAction(HostId host, const std::string& action) {
        auto guest = maps.lookupHost(host);
        if (!guest) {
            GNB_LOG_DEBUG(LogCategory::Host,
                          "ActionInvoked for unmapped host ID " +
                              std::to_string(host.value()));
            return;
        }
        actionInvoked.emit(*guest, action);
    }

    void handleReplied(HostId host, const std::string& text) {
        auto guest = maps.lookupHost(host);
        if (!guest) {
            GNB_LOG_DEBUG(LogCategory::Host,
                          "NotificationReplied for unmapped host ID " +
                              std::to_string(host.value()));
            return;
        }
        replied.emit(*guest, text);
    }

    void handleOwnerChanged() {
        GNB_LOG_WARN(LogCategory::Host,
                     "notification server restarted, dropping " +
                         std::to_string(maps.size()) + " mapped notifications");
        maps.clear();
        auto refreshed = refreshCapabilities();
        if (refreshed.hasError()) {
            // Keep the previous capability set; the next call reports any
            // persistent failure to the guest.
            GNB_LOG_ERROR(LogCategory::Host,
                          "failed to re-query capabilities: " +
                              std::string(refreshed.error().message()));
        }
        serverRestart.emit();
    }

    // -- Notification building -------------------------------------------

    BridgeResult<NotifyCall> buildCall(protocol::Notification n, std::optional<HostId> replaces);
};

namespace {

BridgeResult<NotifyCall> reject(ErrorCode code, std::string message) {
    GNB_LOG_WARN(LogCategory::Sanitizer, "notification refused: " + message);
    return BridgeResult<NotifyCall>::err(BridgeError(code, std::move(message)));
}

} // namespace

BridgeResult<NotifyCall> NotificationEmitter::Impl::buildCall(
    protocol::Notification n, std::optional<HostId> replaces) {
    if (n.expireTimeout < -1) {
        return reject(ErrorCode::InvalidTimeout,
                      "expire timeout " + std::to_string(n.expireTimeout) + " is below -1");
    }
    if (n.actions.size() % 2 != 0) {
        return reject(ErrorCode::OddActionList,
                      "actions must have an even length, got " +
                          std::to_string(n.actions.size()));
    }

    NotifyCall call;
    call.appName = config.applicationName;
    call.replacesId = replaces ? replaces->value() : 0;
    // No icon: nothing in the guest's request can be trusted to pick one.
    call.appIcon.clear();
    call.expireTimeout = n.expireTimeout;

    if (caps.has(Capability::Actions)) {
        call.actions.reserve(n.actions.size());
        for (std::size_t i = 0; i < n.actions.size(); i += 2) {
            auto checked = sanitize::checkActionName(n.actions[i]);
            if (checked.hasError()) {
                return reject(ErrorCode::InvalidActionName,
                              std::string(checked.error().message()));
            }
            call.actions.push_back(std::move(n.actions[i]));
            call.actions.push_back(sanitize::sanitizeText(n.actions[i + 1]));
        }
    }

    auto& hints = call.hints;
    if (n.urgency) {
        hints.urgency = static_cast<uint8_t>(*n.urgency);
    }
    hints.resident = n.resident && caps.has(Capability::Persistence);
    hints.suppressSound = n.suppressSound && caps.has(Capability::Sound);
    hints.transient = n.transient && caps.has(Capability::Persistence);

    if (n.category) {
        auto category = sanitize::validateCategory(*n.category);
        if (category.hasError()) {
            return reject(ErrorCode::InvalidCategory, "Invalid category");
        }
        hints.category = std::move(category).value();
    }

    if (n.image && config.forwardImages) {
        auto image = sanitize::validateImage(std::move(*n.image));
        if (image.hasError()) {
            return reject(ErrorCode::InvalidImage, std::string(image.error().message()));
        }
        hints.image = std::move(image).value();
    }

    call.summary = config.summaryPrefix + sanitize::sanitizeText(n.summary);
    auto body = sanitize::sanitizeText(n.body);
    call.body = caps.has(Capability::BodyMarkup) ? sanitize::escapeMarkup(body)
                                                 : std::move(body);
    return BridgeResult<NotifyCall>::ok(std::move(call));
}

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------

NotificationEmitter::NotificationEmitter(NotificationBackend& backend, HostConfig config)
    : impl_(std::make_unique<Impl>(backend, std::move(config))) {}

NotificationEmitter::~NotificationEmitter() {
    if (!impl_->initialized) {
        return;
    }
    auto& sigs = impl_->backend.signals();
    sigs.closed.disconnect(impl_->closedSlot);
    sigs.actionInvoked.disconnect(impl_->actionSlot);
    sigs.replied.disconnect(impl_->repliedSlot);
    sigs.ownerChanged.disconnect(impl_->ownerSlot);
}

// ---------------------------------------------------------------------------
// initialize()
// ---------------------------------------------------------------------------

BridgeResult<void> NotificationEmitter::initialize() {
    if (impl_->initialized) {
        return BridgeResult<void>::err(
            BridgeError(ErrorCode::AlreadyExists, "emitter already initialized"));
    }

    auto refreshed = impl_->refreshCapabilities();
    if (refreshed.hasError()) {
        return refreshed;
    }

    auto* impl = impl_.get();
    auto& sigs = impl->backend.signals();
    impl->closedSlot = sigs.closed.connect(
        [impl](HostId id, uint32_t reason) { impl->handleClosed(id, reason); });
    impl->actionSlot = sigs.actionInvoked.connect(
        [impl](HostId id, const std::string& action) { impl->handleAction(id, action); });
    impl->repliedSlot = sigs.replied.connect(
        [impl](HostId id, const std::string& text) { impl->handleReplied(id, text); });
    impl->ownerSlot = sigs.ownerChanged.connect([impl]() { impl->handleOwnerChanged(); });

    impl->initialized = true;
    return BridgeResult<void>::ok();
}

Capabilities NotificationEmitter::capabilities() const {
    return impl_->caps;
}

// ---------------------------------------------------------------------------
// sendNotification()
// ---------------------------------------------------------------------------

BridgeResult<GuestId> NotificationEmitter::sendNotification(protocol::Notification untrusted) {
    std::optional<GuestId> replacesGuest;
    std::optional<HostId> replacesHost;
    if (untrusted.replacesId != 0) {
        replacesGuest = GuestId(untrusted.replacesId);
        replacesHost = impl_->maps.lookupGuest(*replacesGuest);
        if (!replacesHost) {
            GNB_LOG_WARN(LogCategory::Sanitizer,
                         "replaces ID " + std::to_string(untrusted.replacesId) +
                             " not found in guest-to-host map");
            return BridgeResult<GuestId>::err(BridgeError(
                ErrorCode::UnknownNotificationId,
                "ID " + std::to_string(untrusted.replacesId) +
                    " not found in guest-to-host lookup map"));
        }
    }

    auto call = impl_->buildCall(std::move(untrusted), replacesHost);
    if (call.hasError()) {
        return BridgeResult<GuestId>::err(call.error());
    }

    auto hostId = impl_->backend.notify(call.value());
    if (hostId.hasError()) {
        return BridgeResult<GuestId>::err(hostId.error());
    }
    if (hostId.value() == 0) {
        return BridgeResult<GuestId>::err(
            BridgeError(ErrorCode::InvalidReply, "notification server returned ID 0"));
    }

    return BridgeResult<GuestId>::ok(
        impl_->maps.assign(HostId(hostId.value()), replacesGuest));
}

// ---------------------------------------------------------------------------
// closeNotification()
// ---------------------------------------------------------------------------

BridgeResult<void> NotificationEmitter::closeNotification(GuestId id) {
    auto host = impl_->maps.lookupGuest(id);
    if (!host) {
        return BridgeResult<void>::err(BridgeError(
            ErrorCode::UnknownNotificationId,
            "cannot close unknown guest ID " + std::to_string(id.value())));
    }
    // The mapping is removed when NotificationClosed arrives.
    return impl_->backend.closeNotification(host->value());
}

// ---------------------------------------------------------------------------
// ID translation
// ---------------------------------------------------------------------------

std::optional<GuestId> NotificationEmitter::translateHostId(HostId id) const {
    return impl_->maps.lookupHost(id);
}

std::optional<GuestId> NotificationEmitter::removeHostId(HostId id) {
    return impl_->maps.removeHost(id);
}

void NotificationEmitter::clear() {
    impl_->maps.clear();
}

std::size_t NotificationEmitter::activeCount() const {
    return impl_->maps.size();
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

Signal<GuestId, uint32_t>& NotificationEmitter::onDismissed() {
    return impl_->dismissed;
}

Signal<GuestId, std::string>& NotificationEmitter::onActionInvoked() {
    return impl_->actionInvoked;
}

Signal<GuestId, std::string>& NotificationEmitter::onReplied() {
    return impl_->replied;
}

Signal<>& NotificationEmitter::onServerRestart() {
    return impl_->serverRestart;
}

} // namespace gnb::service
