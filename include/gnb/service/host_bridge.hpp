#pragma once

/// @file host_bridge.hpp
/// @brief Host side of the bridge: guest messages in, replies and events out.
///
/// HostBridge owns no I/O. The daemon's poll loop feeds it decoded frames
/// from stdin, and it writes replies through a MessageSink. Events from
/// the notification server arrive through the emitter's signals and are
/// written to the same sink.

#include <cstdint>
#include <memory>
#include <span>

#include "gnb/foundation/bridge_result.hpp"
#include "gnb/protocol/frame_channel.hpp"
#include "gnb/protocol/messages.hpp"
#include "gnb/service/host_types.hpp"
#include "gnb/service/notification_emitter.hpp"

namespace gnb::service {

/// Reply sent to the guest when forwarding Notify call @p sequence failed.
///
/// Errors carrying a D-Bus error name keep it; rejected input becomes
/// org.freedesktop.DBus.Error.InvalidArgs; anything else UnknownError.
[[nodiscard]] protocol::ReplyMessage replyForError(const foundation::BridgeError& error,
                                                   uint64_t sequence);

class HostBridge {
public:
    /// @param emitter Initialized emitter; must outlive the bridge.
    /// @param sink    Channel to the guest; must outlive the bridge.
    HostBridge(NotificationEmitter& emitter, protocol::MessageSink& sink);
    ~HostBridge();

    HostBridge(const HostBridge&) = delete;
    HostBridge& operator=(const HostBridge&) = delete;

    /// Subscribe to emitter events. Call once before processing frames.
    void start();

    /// Decode and act on one frame payload from the guest.
    /// @return An error if the payload is malformed or the reply could not
    ///         be written; either is fatal for the connection.
    BridgeResult<void> handleFrame(std::span<const uint8_t> payload);

    /// Handle every complete frame buffered in @p decoder.
    BridgeResult<void> processFrames(protocol::FrameDecoder& decoder);

    /// First error hit while forwarding a server event, if any. Events
    /// arrive from signal callbacks, which cannot return errors directly.
    [[nodiscard]] BridgeResult<void> health() const;

    [[nodiscard]] HostBridgeStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gnb::service
