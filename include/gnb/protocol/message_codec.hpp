#pragma once

/// @file message_codec.hpp
/// @brief Encoding and decoding of GuestMessage / ReplyMessage payloads.
///
/// Decoding is strict: truncated input, an out-of-range discriminant or
/// option tag, a bool other than 0/1, and trailing bytes after a complete
/// message are all errors. A peer that sends any of these is broken or
/// hostile, and callers treat the error as fatal for the connection.

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "gnb/foundation/bridge_result.hpp"
#include "gnb/protocol/messages.hpp"

namespace gnb::protocol {

using foundation::BridgeResult;

[[nodiscard]] std::vector<uint8_t> encodeGuestMessage(const GuestMessage& msg);

[[nodiscard]] BridgeResult<GuestMessage> decodeGuestMessage(
    std::span<const uint8_t> payload);

[[nodiscard]] std::vector<uint8_t> encodeReplyMessage(const ReplyMessage& msg);

[[nodiscard]] BridgeResult<ReplyMessage> decodeReplyMessage(
    std::span<const uint8_t> payload);

/// Variant name for log lines ("Id", "Dismissed", ...).
[[nodiscard]] std::string_view replyMessageName(const ReplyMessage& msg) noexcept;

[[nodiscard]] std::string_view guestMessageName(const GuestMessage& msg) noexcept;

} // namespace gnb::protocol
