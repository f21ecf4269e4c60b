/// @file host_bridge.cpp
/// @brief HostBridge implementation.

#include "gnb/service/host_bridge.hpp"

#include <optional>
#include <string>
#include <type_traits>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/protocol/message_codec.hpp"

namespace gnb::service {

using foundation::BridgeError;
using foundation::DBusErrorInfo;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::Signal;

protocol::ReplyMessage replyForError(const BridgeError& error, uint64_t sequence) {
    if (const auto* info = error.context<DBusErrorInfo>()) {
        return protocol::DBusErrorReply{info->name, std::string(error.message()), sequence};
    }
    if (error.subsystem() == "Validation" || error.code() == ErrorCode::InvalidArgument) {
        return protocol::DBusErrorReply{
            std::string(foundation::DBusErrorName::InvalidArgs),
            std::string(error.message()), sequence};
    }
    return protocol::UnknownErrorReply{sequence};
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct HostBridge::Impl {
    NotificationEmitter& emitter;
    protocol::MessageSink& sink;
    HostBridgeStats stats;
    std::optional<BridgeError> sinkError;
    bool started = false;

    Signal<>::SlotId dismissedSlot = 0;
    Signal<>::SlotId actionSlot = 0;
    Signal<>::SlotId repliedSlot = 0;
    Signal<>::SlotId restartSlot = 0;

    Impl(NotificationEmitter& e, protocol::MessageSink& s) : emitter(e), sink(s) {}

    BridgeResult<void> send(const protocol::ReplyMessage& msg) {
        auto payload = protocol::encodeReplyMessage(msg);
        auto sent = sink.send(payload);
        if (sent.hasError()) {
            GNB_LOG_ERROR(LogCategory::Protocol,
                          "failed to send " + std::string(protocol::replyMessageName(msg)) +
                              ": " + std::string(sent.error().message()));
        }
        return sent;
    }

    void sendEvent(const protocol::ReplyMessage& msg) {
        if (sinkError) {
            return;
        }
        auto sent = send(msg);
        if (sent.hasError()) {
            sinkError = sent.error();
            return;
        }
        ++stats.eventsSent;
    }

    BridgeResult<void> handleNotify(protocol::NotifyMessage msg) {
        const auto sequence = msg.sequence;
        auto result = emitter.sendNotification(std::move(msg.notification));
        if (result.hasValue()) {
            ++stats.notificationsForwarded;
            return send(protocol::IdReply{result.value().value(), sequence});
        }

        ++stats.notificationsRejected;
        const auto& error = result.error();
        GNB_LOG_WARN(LogCategory::Host,
                     "notification " + std::to_string(sequence) + " failed: " +
                         std::string(error.message()));
        return send(replyForError(error, sequence));
    }

    void handleClose(const protocol::CloseMessage& msg) {
        ++stats.closeRequests;
        if (msg.id == 0) {
            GNB_LOG_DEBUG(LogCategory::Host, "ignoring close request for ID 0");
            return;
        }
        auto closed = emitter.closeNotification(GuestId(msg.id));
        if (closed.hasError()) {
            GNB_LOG_INFO(LogCategory::Host,
                         "close of guest ID " + std::to_string(msg.id) +
                             " failed: " + std::string(closed.error().message()));
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------

HostBridge::HostBridge(NotificationEmitter& emitter, protocol::MessageSink& sink)
    : impl_(std::make_unique<Impl>(emitter, sink)) {}

HostBridge::~HostBridge() {
    if (!impl_->started) {
        return;
    }
    auto& e = impl_->emitter;
    e.onDismissed().disconnect(impl_->dismissedSlot);
    e.onActionInvoked().disconnect(impl_->actionSlot);
    e.onReplied().disconnect(impl_->repliedSlot);
    e.onServerRestart().disconnect(impl_->restartSlot);
}

void HostBridge::start() {
    if (impl_->started) {
        return;
    }
    auto* impl = impl_.get();
    auto& e = impl->emitter;
    impl->dismissedSlot = e.onDismissed().connect([impl](GuestId id, uint32_t reason) {
        impl->sendEvent(protocol::DismissedEvent{id.value(), reason});
    });
    impl->actionSlot = e.onActionInvoked().connect(
        [impl](GuestId id, const std::string& action) {
            impl->sendEvent(protocol::ActionInvokedEvent{id.value(), action});
        });
    impl->repliedSlot = e.onReplied().connect([impl](GuestId id, const std::string& text) {
        impl->sendEvent(protocol::RepliedEvent{id.value(), text});
    });
    impl->restartSlot = e.onServerRestart().connect([impl]() {
        impl->sendEvent(protocol::ServerRestartEvent{});
    });
    impl->started = true;
}

// ---------------------------------------------------------------------------
// Frame handling
// ---------------------------------------------------------------------------

BridgeResult<void> HostBridge::handleFrame(std::span<const uint8_t> payload) {
    ++impl_->stats.framesReceived;

    auto decoded = protocol::decodeGuestMessage(payload);
    if (decoded.hasError()) {
        GNB_LOG_ERROR(LogCategory::Protocol,
                      "malformed input from guest: " +
                          std::string(decoded.error().message()));
        return BridgeResult<void>::err(decoded.error());
    }

    return std::visit([this](auto&& msg) -> BridgeResult<void> {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, protocol::NotifyMessage>) {
            return impl_->handleNotify(std::move(msg));
        } else {
            impl_->handleClose(msg);
            return BridgeResult<void>::ok();
        }
    }, std::move(decoded).value());
}

BridgeResult<void> HostBridge::processFrames(protocol::FrameDecoder& decoder) {
    for (;;) {
        auto frame = decoder.next();
        if (frame.hasError()) {
            GNB_LOG_ERROR(LogCategory::Protocol,
                          std::string(frame.error().message()));
            return BridgeResult<void>::err(frame.error());
        }
        if (!frame.value()) {
            return BridgeResult<void>::ok();
        }
        auto handled = handleFrame(*frame.value());
        if (handled.hasError()) {
            return handled;
        }
    }
}

BridgeResult<void> HostBridge::health() const {
    if (impl_->sinkError) {
        return BridgeResult<void>::err(*impl_->sinkError);
    }
    return BridgeResult<void>::ok();
}

HostBridgeStats HostBridge::stats() const {
    return impl_->stats;
}

} // namespace gnb::service
