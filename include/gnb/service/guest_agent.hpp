#pragma once

/// @file guest_agent.hpp
/// @brief Guest side of the bridge: Notify calls out, replies and events in.
///
/// GuestAgent owns no I/O. The D-Bus service hands it notification
/// requests with a completion callback; the request is sent to the host
/// tagged with a sequence number, and the callback runs once the host's
/// reply frame for that sequence is processed.

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

#include "gnb/foundation/bridge_result.hpp"
#include "gnb/protocol/frame_channel.hpp"
#include "gnb/service/guest_types.hpp"

namespace gnb::service {

using foundation::BridgeResult;

/// Receives host events to be re-emitted as D-Bus signals in the guest.
class GuestSignalSink {
public:
    virtual ~GuestSignalSink() = default;

    virtual BridgeResult<void> emitNotificationClosed(uint32_t id, uint32_t reason) = 0;
    virtual BridgeResult<void> emitActionInvoked(uint32_t id, const std::string& action) = 0;
    virtual BridgeResult<void> emitNotificationReplied(uint32_t id, const std::string& text) = 0;
};

/// Completion of a forwarded Notify call: the guest-visible ID, or the
/// error to return to the caller. Errors carrying a DBusErrorInfo context
/// should be returned under that D-Bus error name.
using NotifyCompletion = std::function<void(BridgeResult<uint32_t>)>;

class GuestAgent {
public:
    /// @param sink    Channel to the host; must outlive the agent.
    /// @param signals Signal emitter; must outlive the agent.
    GuestAgent(protocol::MessageSink& sink, GuestSignalSink& signals);
    ~GuestAgent();

    GuestAgent(const GuestAgent&) = delete;
    GuestAgent& operator=(const GuestAgent&) = delete;

    /// Validate and forward a Notify call.
    ///
    /// On success @p done is invoked later, exactly once, from
    /// handleFrame() or failPending(). On failure it is never invoked.
    /// @return The sequence number assigned to the call.
    BridgeResult<uint64_t> submitNotify(NotifyRequest request, NotifyCompletion done);

    /// Forward CloseNotification. The caller does not wait for the host.
    BridgeResult<void> submitClose(uint32_t id);

    /// Decode and act on one frame payload from the host.
    /// @return An error for malformed input or a reply to an unknown
    ///         sequence number; either is fatal for the connection.
    BridgeResult<void> handleFrame(std::span<const uint8_t> payload);

    /// Handle every complete frame buffered in @p decoder.
    BridgeResult<void> processFrames(protocol::FrameDecoder& decoder);

    /// Complete every pending call with @p error (host went away).
    void failPending(const foundation::BridgeError& error);

    [[nodiscard]] std::size_t pendingCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gnb::service
