/// @file guest_agent.cpp
/// @brief GuestAgent implementation.

#include "gnb/service/guest_agent.hpp"

#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/protocol/message_codec.hpp"
#include "gnb/service/hint_parser.hpp"

namespace gnb::service {

using foundation::BridgeError;
using foundation::DBusErrorInfo;
using foundation::ErrorCode;
using foundation::LogCategory;

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct GuestAgent::Impl {
    protocol::MessageSink& sink;
    GuestSignalSink& signals;
    std::unordered_map<uint64_t, NotifyCompletion> pending;
    uint64_t nextSequence = 0;

    Impl(protocol::MessageSink& s, GuestSignalSink& sig) : sink(s), signals(sig) {}

    BridgeResult<void> complete(uint64_t sequence, BridgeResult<uint32_t> result) {
        auto it = pending.find(sequence);
        if (it == pending.end()) {
            return BridgeResult<void>::err(BridgeError(
                ErrorCode::ProtocolViolation,
                "host replied to unknown sequence number " + std::to_string(sequence)));
        }
        auto done = std::move(it->second);
        pending.erase(it);
        done(std::move(result));
        return BridgeResult<void>::ok();
    }

    void logSignalFailure(const char* name, const BridgeResult<void>& emitted) {
        if (emitted.hasError()) {
            GNB_LOG_WARN(LogCategory::DBus,
                         std::string("cannot emit ") + name + ": " +
                             std::string(emitted.error().message()));
        }
    }

    BridgeResult<void> dispatch(protocol::ReplyMessage msg) {
        return std::visit([this](auto&& m) -> BridgeResult<void> {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, protocol::IdReply>) {
                return complete(m.sequence, BridgeResult<uint32_t>::ok(m.id));
            } else if constexpr (std::is_same_v<T, protocol::DBusErrorReply>) {
                return complete(m.sequence, BridgeResult<uint32_t>::err(BridgeError(
                    ErrorCode::MethodCallFailed, m.message.value_or("failed"),
                    DBusErrorInfo{m.name})));
            } else if constexpr (std::is_same_v<T, protocol::UnknownErrorReply>) {
                return complete(m.sequence, BridgeResult<uint32_t>::err(BridgeError(
                    ErrorCode::Unknown, "notification could not be delivered",
                    DBusErrorInfo{std::string(foundation::DBusErrorName::Failed)})));
            } else if constexpr (std::is_same_v<T, protocol::DismissedEvent>) {
                logSignalFailure("NotificationClosed",
                                 signals.emitNotificationClosed(m.id, m.reason));
                return BridgeResult<void>::ok();
            } else if constexpr (std::is_same_v<T, protocol::ActionInvokedEvent>) {
                logSignalFailure("ActionInvoked", signals.emitActionInvoked(m.id, m.action));
                return BridgeResult<void>::ok();
            } else if constexpr (std::is_same_v<T, protocol::ServerRestartEvent>) {
                GNB_LOG_INFO(LogCategory::Guest,
                             "host notification server restarted, earlier IDs are stale");
                return BridgeResult<void>::ok();
            } else {
                logSignalFailure("NotificationReplied",
                                 signals.emitNotificationReplied(m.id, m.text));
                return BridgeResult<void>::ok();
            }
        }, std::move(msg));
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------

GuestAgent::GuestAgent(protocol::MessageSink& sink, GuestSignalSink& signals)
    : impl_(std::make_unique<Impl>(sink, signals)) {}

GuestAgent::~GuestAgent() = default;

// ---------------------------------------------------------------------------
// Outgoing
// ---------------------------------------------------------------------------

BridgeResult<uint64_t> GuestAgent::submitNotify(NotifyRequest request, NotifyCompletion done) {
    auto notification = buildNotification(std::move(request));
    if (notification.hasError()) {
        return BridgeResult<uint64_t>::err(notification.error());
    }

    const uint64_t sequence = impl_->nextSequence++;
    auto payload = protocol::encodeGuestMessage(
        protocol::NotifyMessage{sequence, std::move(notification).value()});

    auto sent = impl_->sink.send(payload);
    if (sent.hasError()) {
        return BridgeResult<uint64_t>::err(sent.error());
    }
    impl_->pending.emplace(sequence, std::move(done));
    GNB_LOG_DEBUG(LogCategory::Guest,
                  "notification " + std::to_string(sequence) + " sent to host");
    return BridgeResult<uint64_t>::ok(sequence);
}

BridgeResult<void> GuestAgent::submitClose(uint32_t id) {
    auto payload = protocol::encodeGuestMessage(protocol::CloseMessage{id});
    return impl_->sink.send(payload);
}

// ---------------------------------------------------------------------------
// Incoming
// ---------------------------------------------------------------------------

BridgeResult<void> GuestAgent::handleFrame(std::span<const uint8_t> payload) {
    auto decoded = protocol::decodeReplyMessage(payload);
    if (decoded.hasError()) {
        GNB_LOG_ERROR(LogCategory::Protocol,
                      "malformed input from host: " +
                          std::string(decoded.error().message()));
        return BridgeResult<void>::err(decoded.error());
    }
    GNB_LOG_DEBUG(LogCategory::Protocol,
                  "received " + std::string(protocol::replyMessageName(decoded.value())));

    auto handled = impl_->dispatch(std::move(decoded).value());
    if (handled.hasError()) {
        GNB_LOG_ERROR(LogCategory::Protocol, std::string(handled.error().message()));
    }
    return handled;
}

BridgeResult<void> GuestAgent::processFrames(protocol::FrameDecoder& decoder) {
    for (;;) {
        auto frame = decoder.next();
        if (frame.hasError()) {
            GNB_LOG_ERROR(LogCategory::Protocol, std::string(frame.error().message()));
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

void GuestAgent::failPending(const BridgeError& error) {
    auto pending = std::move(impl_->pending);
    impl_->pending.clear();
    for (auto& [sequence, done] : pending) {
        done(BridgeResult<uint32_t>::err(error));
    }
}

std::size_t GuestAgent::pendingCount() const {
    return impl_->pending.size();
}

} // namespace gnb::service
