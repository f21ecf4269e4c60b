#pragma once

/// @file frame_channel.hpp
/// @brief Length-prefixed framing over a byte stream (stdin/stdout).
///
/// Frame layout: u32 little-endian payload length, then the payload.
/// Reading is incremental so that the poll loops never block on a
/// partially received frame; writing is blocking and complete.

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "gnb/foundation/bridge_result.hpp"
#include "gnb/protocol/messages.hpp"

namespace gnb::protocol {

using foundation::BridgeResult;

/// Build a complete frame (length prefix plus payload).
[[nodiscard]] std::vector<uint8_t> encodeFrame(std::span<const uint8_t> payload);

/// Incremental frame decoder.
///
/// Bytes are fed in arbitrary chunks; next() yields one complete payload
/// at a time. A length above the configured maximum is reported as
/// MessageTooLarge as soon as the prefix has arrived, before the payload
/// is buffered.
class FrameDecoder {
public:
    explicit FrameDecoder(uint32_t maxMessageSize = kMaxMessageSize) noexcept
        : maxMessageSize_(maxMessageSize) {}

    void feed(std::span<const uint8_t> bytes);

    /// @return A payload, std::nullopt if more input is needed, or an error.
    BridgeResult<std::optional<std::vector<uint8_t>>> next();

    /// Number of buffered bytes not yet returned as a payload.
    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size() - consumed_; }

private:
    uint32_t maxMessageSize_;
    std::vector<uint8_t> buffer_;
    std::size_t consumed_ = 0;
};

/// Destination for encoded payloads.
class MessageSink {
public:
    virtual ~MessageSink() = default;

    /// Send one payload as a frame.
    virtual BridgeResult<void> send(std::span<const uint8_t> payload) = 0;
};

/// MessageSink writing frames to a file descriptor.
///
/// The writer does not own the descriptor.
class FdFrameWriter : public MessageSink {
public:
    explicit FdFrameWriter(int fd) noexcept : fd_(fd) {}

    BridgeResult<void> send(std::span<const uint8_t> payload) override;

private:
    int fd_;
};

/// Write every byte, retrying on EINTR and partial writes.
BridgeResult<void> writeAll(int fd, std::span<const uint8_t> bytes);

/// Read exactly bytes.size() bytes. EOF before that is ChannelClosed.
BridgeResult<void> readExact(int fd, std::span<uint8_t> bytes);

/// Perform one read() on a readable descriptor and feed the decoder.
/// @return true if data was read, false on end of stream.
BridgeResult<bool> readAvailable(int fd, FrameDecoder& decoder);

} // namespace gnb::protocol
