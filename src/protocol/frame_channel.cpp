/// @file frame_channel.cpp
/// @brief Frame encoding/decoding and blocking descriptor I/O.

#include "gnb/protocol/frame_channel.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <unistd.h>

namespace gnb::protocol {

using foundation::BridgeError;
using foundation::ErrorCode;

namespace {

constexpr std::size_t kPrefixSize = 4;
constexpr std::size_t kReadChunk = 64 * 1024;

uint32_t readLengthPrefix(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

BridgeError ioError(const char* op, int err) {
    return BridgeError(ErrorCode::ChannelIoError,
                       std::string(op) + " failed: " + std::strerror(err));
}

} // namespace

std::vector<uint8_t> encodeFrame(std::span<const uint8_t> payload) {
    auto len = static_cast<uint32_t>(payload.size());
    std::vector<uint8_t> frame;
    frame.reserve(kPrefixSize + payload.size());
    for (int shift = 0; shift < 32; shift += 8) {
        frame.push_back(static_cast<uint8_t>(len >> shift));
    }
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

// ---------------------------------------------------------------------------
// FrameDecoder
// ---------------------------------------------------------------------------

void FrameDecoder::feed(std::span<const uint8_t> bytes) {
    // Compact before growing so the buffer does not creep forward forever.
    if (consumed_ > 0 && consumed_ == buffer_.size()) {
        buffer_.clear();
        consumed_ = 0;
    } else if (consumed_ > kReadChunk) {
        buffer_.erase(buffer_.begin(),
                      buffer_.begin() + static_cast<std::ptrdiff_t>(consumed_));
        consumed_ = 0;
    }
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

BridgeResult<std::optional<std::vector<uint8_t>>> FrameDecoder::next() {
    using Out = BridgeResult<std::optional<std::vector<uint8_t>>>;

    if (buffered() < kPrefixSize) {
        return Out::ok(std::nullopt);
    }
    const uint8_t* start = buffer_.data() + consumed_;
    uint32_t len = readLengthPrefix(start);
    if (len > maxMessageSize_) {
        return Out::err(BridgeError(
            ErrorCode::MessageTooLarge,
            "message too large (" + std::to_string(len) + " bytes, limit " +
                std::to_string(maxMessageSize_) + ")"));
    }
    if (buffered() - kPrefixSize < len) {
        return Out::ok(std::nullopt);
    }
    std::vector<uint8_t> payload(start + kPrefixSize, start + kPrefixSize + len);
    consumed_ += kPrefixSize + len;
    return Out::ok(std::move(payload));
}

// ---------------------------------------------------------------------------
// Descriptor I/O
// ---------------------------------------------------------------------------

BridgeResult<void> writeAll(int fd, std::span<const uint8_t> bytes) {
    std::size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) {
                return BridgeResult<void>::err(
                    BridgeError(ErrorCode::ChannelClosed, "peer closed the channel"));
            }
            return BridgeResult<void>::err(ioError("write", errno));
        }
        written += static_cast<std::size_t>(n);
    }
    return BridgeResult<void>::ok();
}

BridgeResult<void> readExact(int fd, std::span<uint8_t> bytes) {
    std::size_t got = 0;
    while (got < bytes.size()) {
        ssize_t n = ::read(fd, bytes.data() + got, bytes.size() - got);
        if (n < 0) {
            if (errno == EINTR) continue;
            return BridgeResult<void>::err(ioError("read", errno));
        }
        if (n == 0) {
            return BridgeResult<void>::err(
                BridgeError(ErrorCode::ChannelClosed, "unexpected end of stream"));
        }
        got += static_cast<std::size_t>(n);
    }
    return BridgeResult<void>::ok();
}

BridgeResult<bool> readAvailable(int fd, FrameDecoder& decoder) {
    uint8_t chunk[kReadChunk];
    for (;;) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return BridgeResult<bool>::ok(true);
            }
            return BridgeResult<bool>::err(ioError("read", errno));
        }
        if (n == 0) {
            return BridgeResult<bool>::ok(false);
        }
        decoder.feed(std::span<const uint8_t>(chunk, static_cast<std::size_t>(n)));
        return BridgeResult<bool>::ok(true);
    }
}

BridgeResult<void> FdFrameWriter::send(std::span<const uint8_t> payload) {
    if (payload.size() > kMaxMessageSize) {
        return BridgeResult<void>::err(BridgeError(
            ErrorCode::MessageTooLarge,
            "refusing to send " + std::to_string(payload.size()) + " byte message"));
    }
    auto frame = encodeFrame(payload);
    return writeAll(fd_, frame);
}

} // namespace gnb::protocol
