#pragma once

/// @file test_doubles.hpp
/// @brief In-memory stand-ins for the bus and the peer channel.

#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "gnb/foundation/bridge_error.hpp"
#include "gnb/protocol/frame_channel.hpp"
#include "gnb/protocol/message_codec.hpp"
#include "gnb/service/guest_agent.hpp"
#include "gnb/service/notification_backend.hpp"

namespace gnb::test {

using foundation::BridgeError;
using foundation::BridgeResult;
using foundation::ErrorCode;

// ---------------------------------------------------------------------------
// FakeNotificationBackend: records calls, hands out sequential host IDs
// ---------------------------------------------------------------------------

class FakeNotificationBackend : public service::NotificationBackend {
public:
    BridgeResult<std::vector<std::string>> getCapabilities() override {
        ++capabilityQueries;
        if (capabilitiesError) {
            return BridgeResult<std::vector<std::string>>::err(*capabilitiesError);
        }
        return BridgeResult<std::vector<std::string>>::ok(capabilities);
    }

    BridgeResult<uint32_t> notify(const service::NotifyCall& call) override {
        calls.push_back(call);
        if (!notifyErrors.empty()) {
            auto error = std::move(notifyErrors.front());
            notifyErrors.pop_front();
            return BridgeResult<uint32_t>::err(std::move(error));
        }
        if (fixedId) {
            return BridgeResult<uint32_t>::ok(*fixedId);
        }
        if (call.replacesId != 0) {
            return BridgeResult<uint32_t>::ok(call.replacesId);
        }
        return BridgeResult<uint32_t>::ok(nextId++);
    }

    BridgeResult<void> closeNotification(uint32_t id) override {
        closed.push_back(id);
        if (closeError) {
            return BridgeResult<void>::err(*closeError);
        }
        return BridgeResult<void>::ok();
    }

    service::BackendSignals& signals() noexcept override { return signals_; }

    /// Queue a D-Bus error reply for the next notify() call.
    void failNextNotify(std::string name, std::string message) {
        notifyErrors.emplace_back(ErrorCode::MethodCallFailed, std::move(message),
                                  foundation::DBusErrorInfo{std::move(name)});
    }

    std::vector<std::string> capabilities = {"body", "actions", "persistence"};
    std::optional<BridgeError> capabilitiesError;
    std::deque<BridgeError> notifyErrors;
    std::optional<BridgeError> closeError;
    std::optional<uint32_t> fixedId;
    uint32_t nextId = 100;

    int capabilityQueries = 0;
    std::vector<service::NotifyCall> calls;
    std::vector<uint32_t> closed;

private:
    service::BackendSignals signals_;
};

// ---------------------------------------------------------------------------
// RecordingSink: keeps every payload sent through it
// ---------------------------------------------------------------------------

class RecordingSink : public protocol::MessageSink {
public:
    BridgeResult<void> send(std::span<const uint8_t> payload) override {
        if (failure) {
            return BridgeResult<void>::err(*failure);
        }
        payloads.emplace_back(payload.begin(), payload.end());
        return BridgeResult<void>::ok();
    }

    /// Decode every recorded payload as a host reply.
    std::vector<protocol::ReplyMessage> replies() const {
        std::vector<protocol::ReplyMessage> out;
        for (const auto& p : payloads) {
            auto decoded = protocol::decodeReplyMessage(p);
            if (decoded) {
                out.push_back(std::move(decoded).value());
            }
        }
        return out;
    }

    /// Decode every recorded payload as a guest message.
    std::vector<protocol::GuestMessage> guestMessages() const {
        std::vector<protocol::GuestMessage> out;
        for (const auto& p : payloads) {
            auto decoded = protocol::decodeGuestMessage(p);
            if (decoded) {
                out.push_back(std::move(decoded).value());
            }
        }
        return out;
    }

    std::vector<std::vector<uint8_t>> payloads;
    std::optional<BridgeError> failure;
};

// ---------------------------------------------------------------------------
// LoopbackSink: frames payloads into a decoder the peer drains
// ---------------------------------------------------------------------------

/// Frames every payload into a FrameDecoder, as a byte stream would.
class LoopbackSink : public protocol::MessageSink {
public:
    BridgeResult<void> send(std::span<const uint8_t> payload) override {
        decoder.feed(protocol::encodeFrame(payload));
        return BridgeResult<void>::ok();
    }

    protocol::FrameDecoder decoder;
};

// ---------------------------------------------------------------------------
// RecordingSignalSink: records D-Bus signals the guest would emit
// ---------------------------------------------------------------------------

class RecordingSignalSink : public service::GuestSignalSink {
public:
    BridgeResult<void> emitNotificationClosed(uint32_t id, uint32_t reason) override {
        closed.emplace_back(id, reason);
        return result();
    }

    BridgeResult<void> emitActionInvoked(uint32_t id, const std::string& action) override {
        actions.emplace_back(id, action);
        return result();
    }

    BridgeResult<void> emitNotificationReplied(uint32_t id, const std::string& text) override {
        replies.emplace_back(id, text);
        return result();
    }

    std::vector<std::pair<uint32_t, uint32_t>> closed;
    std::vector<std::pair<uint32_t, std::string>> actions;
    std::vector<std::pair<uint32_t, std::string>> replies;
    bool failEmits = false;

private:
    BridgeResult<void> result() const {
        if (failEmits) {
            return BridgeResult<void>::err(
                BridgeError(ErrorCode::SignalEmitFailed, "bus is gone"));
        }
        return BridgeResult<void>::ok();
    }
};

} // namespace gnb::test
