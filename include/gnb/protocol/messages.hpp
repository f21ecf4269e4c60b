#pragma once

/// @file messages.hpp
/// @brief Message types exchanged between the guest agent and host daemon.
///
/// Each std::variant alternative index equals the wire discriminant of the
/// corresponding variant, so new variants must only ever be appended.

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gnb::protocol {

// -- Limits and versioning ---------------------------------------------------

/// Largest frame payload either side accepts (16 MiB).
inline constexpr uint32_t kMaxMessageSize = 0x1000000;

inline constexpr uint16_t kMajorVersion = 1;
inline constexpr uint16_t kMinorVersion = 0;

constexpr uint32_t mergeVersions(uint16_t major, uint16_t minor) noexcept {
    return (static_cast<uint32_t>(major) << 16) | static_cast<uint32_t>(minor);
}

constexpr std::pair<uint16_t, uint16_t> splitVersion(uint32_t combined) noexcept {
    return {static_cast<uint16_t>(combined >> 16),
            static_cast<uint16_t>(combined & 0xFFFF)};
}

// -- Notification ------------------------------------------------------------

enum class Urgency : uint32_t {
    Low = 0,
    Normal = 1,
    Critical = 2
};

/// Raw image as received from the guest. No field is trusted until it has
/// passed sanitize::validateImage().
struct ImageParameters {
    int32_t untrustedWidth = 0;
    int32_t untrustedHeight = 0;
    int32_t untrustedRowstride = 0;
    bool untrustedHasAlpha = false;
    int32_t untrustedBitsPerSample = 0;
    int32_t untrustedChannels = 0;
    std::vector<uint8_t> untrustedData;

    bool operator==(const ImageParameters&) const = default;
};

/// Notification request (wire variant 0, "V1").
struct Notification {
    bool suppressSound = false;
    bool transient = false;
    bool resident = false;
    std::optional<Urgency> urgency;
    uint32_t replacesId = 0;
    std::string summary;
    std::string body;
    std::vector<std::string> actions;
    std::optional<std::string> category;
    int32_t expireTimeout = -1;
    std::optional<ImageParameters> image;

    bool operator==(const Notification&) const = default;
};

// -- Guest -> host -----------------------------------------------------------

struct NotifyMessage {
    uint64_t sequence = 0;
    Notification notification;

    bool operator==(const NotifyMessage&) const = default;
};

struct CloseMessage {
    uint32_t id = 0;

    bool operator==(const CloseMessage&) const = default;
};

using GuestMessage = std::variant<NotifyMessage, CloseMessage>;

// -- Host -> guest -----------------------------------------------------------

struct IdReply {
    uint32_t id = 0;
    uint64_t sequence = 0;

    bool operator==(const IdReply&) const = default;
};

struct DBusErrorReply {
    std::string name;
    std::optional<std::string> message;
    uint64_t sequence = 0;

    bool operator==(const DBusErrorReply&) const = default;
};

struct UnknownErrorReply {
    uint64_t sequence = 0;

    bool operator==(const UnknownErrorReply&) const = default;
};

struct DismissedEvent {
    uint32_t id = 0;
    uint32_t reason = 0;

    bool operator==(const DismissedEvent&) const = default;
};

struct ActionInvokedEvent {
    uint32_t id = 0;
    std::string action;

    bool operator==(const ActionInvokedEvent&) const = default;
};

struct ServerRestartEvent {
    bool operator==(const ServerRestartEvent&) const = default;
};

/// Inline reply typed by the user (KDE NotificationReplied extension).
struct RepliedEvent {
    uint32_t id = 0;
    std::string text;

    bool operator==(const RepliedEvent&) const = default;
};

using ReplyMessage = std::variant<IdReply,
                                  DBusErrorReply,
                                  UnknownErrorReply,
                                  DismissedEvent,
                                  ActionInvokedEvent,
                                  ServerRestartEvent,
                                  RepliedEvent>;

} // namespace gnb::protocol
