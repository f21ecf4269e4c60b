/// @file message_codec.cpp
/// @brief GuestMessage / ReplyMessage codec implementation.

#include "gnb/protocol/message_codec.hpp"

#include <string>
#include <type_traits>

#include "gnb/protocol/wire_codec.hpp"

namespace gnb::protocol {

using foundation::BridgeError;
using foundation::ErrorCode;

namespace {

// Wire discriminant of the only Notification layout defined so far.
constexpr uint32_t kNotificationV1 = 0;

// ---------------------------------------------------------------------------
// Encoding helpers
// ---------------------------------------------------------------------------

void writeImage(WireWriter& w, const ImageParameters& image) {
    w.writeI32(image.untrustedWidth);
    w.writeI32(image.untrustedHeight);
    w.writeI32(image.untrustedRowstride);
    w.writeBool(image.untrustedHasAlpha);
    w.writeI32(image.untrustedBitsPerSample);
    w.writeI32(image.untrustedChannels);
    w.writeBytes(image.untrustedData);
}

void writeNotification(WireWriter& w, const Notification& n) {
    w.writeU32(kNotificationV1);
    w.writeBool(n.suppressSound);
    w.writeBool(n.transient);
    w.writeBool(n.resident);
    if (n.urgency) {
        w.writeU8(1);
        w.writeU32(static_cast<uint32_t>(*n.urgency));
    } else {
        w.writeU8(0);
    }
    w.writeU32(n.replacesId);
    w.writeString(n.summary);
    w.writeString(n.body);
    w.writeStringList(n.actions);
    if (n.category) {
        w.writeU8(1);
        w.writeString(*n.category);
    } else {
        w.writeU8(0);
    }
    w.writeI32(n.expireTimeout);
    if (n.image) {
        w.writeU8(1);
        writeImage(w, *n.image);
    } else {
        w.writeU8(0);
    }
}

// ---------------------------------------------------------------------------
// Decoding helpers
// ---------------------------------------------------------------------------

/// Reader plus the reason the first failing read failed.
struct Decoder {
    WireReader reader;
    ErrorCode failure = ErrorCode::TruncatedMessage;
    std::string detail = "message truncated";

    bool fail(ErrorCode code, std::string why) {
        failure = code;
        detail = std::move(why);
        return false;
    }

    bool readDiscriminant(uint32_t& out, uint32_t count, const char* what) {
        if (!reader.readU32(out)) return false;
        if (out >= count) {
            return fail(ErrorCode::UnknownVariant,
                        std::string("unknown ") + what + " variant " + std::to_string(out));
        }
        return true;
    }

    bool readOptionTag(bool& present) {
        uint8_t tag = 0;
        if (!reader.readU8(tag)) return false;
        if (tag > 1) {
            return fail(ErrorCode::InvalidMessage,
                        "invalid option tag " + std::to_string(tag));
        }
        present = (tag == 1);
        return true;
    }

    bool readBool(bool& out) {
        uint8_t raw = 0;
        if (!reader.readU8(raw)) return false;
        if (raw > 1) {
            return fail(ErrorCode::InvalidMessage,
                        "invalid bool value " + std::to_string(raw));
        }
        out = (raw == 1);
        return true;
    }

    bool readOptionalString(std::optional<std::string>& out) {
        bool present = false;
        if (!readOptionTag(present)) return false;
        if (!present) {
            out.reset();
            return true;
        }
        std::string value;
        if (!reader.readString(value)) return false;
        out = std::move(value);
        return true;
    }

    bool readImage(ImageParameters& image) {
        return reader.readI32(image.untrustedWidth) &&
               reader.readI32(image.untrustedHeight) &&
               reader.readI32(image.untrustedRowstride) &&
               readBool(image.untrustedHasAlpha) &&
               reader.readI32(image.untrustedBitsPerSample) &&
               reader.readI32(image.untrustedChannels) &&
               reader.readBytes(image.untrustedData);
    }

    bool readNotification(Notification& n) {
        uint32_t version = 0;
        if (!readDiscriminant(version, 1, "notification")) return false;
        if (!readBool(n.suppressSound) || !readBool(n.transient) ||
            !readBool(n.resident)) {
            return false;
        }

        bool hasUrgency = false;
        if (!readOptionTag(hasUrgency)) return false;
        if (hasUrgency) {
            uint32_t urgency = 0;
            if (!readDiscriminant(urgency, 3, "urgency")) return false;
            n.urgency = static_cast<Urgency>(urgency);
        } else {
            n.urgency.reset();
        }

        if (!reader.readU32(n.replacesId) || !reader.readString(n.summary) ||
            !reader.readString(n.body) || !reader.readStringList(n.actions) ||
            !readOptionalString(n.category) || !reader.readI32(n.expireTimeout)) {
            return false;
        }

        bool hasImage = false;
        if (!readOptionTag(hasImage)) return false;
        if (hasImage) {
            ImageParameters image;
            if (!readImage(image)) return false;
            n.image = std::move(image);
        } else {
            n.image.reset();
        }
        return true;
    }

    template <typename T>
    BridgeResult<T> finish(bool ok, T value) {
        if (!ok) {
            return BridgeResult<T>::err(BridgeError(failure, detail));
        }
        if (!reader.atEnd()) {
            return BridgeResult<T>::err(BridgeError(
                ErrorCode::TrailingBytes,
                std::to_string(reader.remaining()) + " trailing bytes after message"));
        }
        return BridgeResult<T>::ok(std::move(value));
    }
};

template <class>
inline constexpr bool kAlwaysFalse = false;

} // namespace

// ---------------------------------------------------------------------------
// GuestMessage
// ---------------------------------------------------------------------------

std::vector<uint8_t> encodeGuestMessage(const GuestMessage& msg) {
    WireWriter w;
    w.writeU32(static_cast<uint32_t>(msg.index()));
    std::visit([&w](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, NotifyMessage>) {
            w.writeU64(m.sequence);
            writeNotification(w, m.notification);
        } else if constexpr (std::is_same_v<T, CloseMessage>) {
            w.writeU32(m.id);
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled GuestMessage variant");
        }
    }, msg);
    return w.take();
}

BridgeResult<GuestMessage> decodeGuestMessage(std::span<const uint8_t> payload) {
    Decoder d{WireReader(payload)};
    uint32_t kind = 0;
    if (!d.readDiscriminant(kind, std::variant_size_v<GuestMessage>, "guest message")) {
        return d.finish(false, GuestMessage{});
    }

    switch (kind) {
        case 0: {
            NotifyMessage m;
            bool ok = d.reader.readU64(m.sequence) && d.readNotification(m.notification);
            return d.finish(ok, GuestMessage{std::move(m)});
        }
        default: {
            CloseMessage m;
            bool ok = d.reader.readU32(m.id);
            return d.finish(ok, GuestMessage{m});
        }
    }
}

std::string_view guestMessageName(const GuestMessage& msg) noexcept {
    switch (msg.index()) {
        case 0: return "Notify";
        case 1: return "Close";
        default: return "Unknown";
    }
}

// ---------------------------------------------------------------------------
// ReplyMessage
// ---------------------------------------------------------------------------

std::vector<uint8_t> encodeReplyMessage(const ReplyMessage& msg) {
    WireWriter w;
    w.writeU32(static_cast<uint32_t>(msg.index()));
    std::visit([&w](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, IdReply>) {
            w.writeU32(m.id);
            w.writeU64(m.sequence);
        } else if constexpr (std::is_same_v<T, DBusErrorReply>) {
            w.writeString(m.name);
            if (m.message) {
                w.writeU8(1);
                w.writeString(*m.message);
            } else {
                w.writeU8(0);
            }
            w.writeU64(m.sequence);
        } else if constexpr (std::is_same_v<T, UnknownErrorReply>) {
            w.writeU64(m.sequence);
        } else if constexpr (std::is_same_v<T, DismissedEvent>) {
            w.writeU32(m.id);
            w.writeU32(m.reason);
        } else if constexpr (std::is_same_v<T, ActionInvokedEvent>) {
            w.writeU32(m.id);
            w.writeString(m.action);
        } else if constexpr (std::is_same_v<T, ServerRestartEvent>) {
            // no payload
        } else if constexpr (std::is_same_v<T, RepliedEvent>) {
            w.writeU32(m.id);
            w.writeString(m.text);
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled ReplyMessage variant");
        }
    }, msg);
    return w.take();
}

BridgeResult<ReplyMessage> decodeReplyMessage(std::span<const uint8_t> payload) {
    Decoder d{WireReader(payload)};
    uint32_t kind = 0;
    if (!d.readDiscriminant(kind, std::variant_size_v<ReplyMessage>, "reply message")) {
        return d.finish(false, ReplyMessage{});
    }

    switch (kind) {
        case 0: {
            IdReply m;
            bool ok = d.reader.readU32(m.id) && d.reader.readU64(m.sequence);
            return d.finish(ok, ReplyMessage{m});
        }
        case 1: {
            DBusErrorReply m;
            bool ok = d.reader.readString(m.name) && d.readOptionalString(m.message) &&
                      d.reader.readU64(m.sequence);
            return d.finish(ok, ReplyMessage{std::move(m)});
        }
        case 2: {
            UnknownErrorReply m;
            bool ok = d.reader.readU64(m.sequence);
            return d.finish(ok, ReplyMessage{m});
        }
        case 3: {
            DismissedEvent m;
            bool ok = d.reader.readU32(m.id) && d.reader.readU32(m.reason);
            return d.finish(ok, ReplyMessage{m});
        }
        case 4: {
            ActionInvokedEvent m;
            bool ok = d.reader.readU32(m.id) && d.reader.readString(m.action);
            return d.finish(ok, ReplyMessage{std::move(m)});
        }
        case 5:
            return d.finish(true, ReplyMessage{ServerRestartEvent{}});
        default: {
            RepliedEvent m;
            bool ok = d.reader.readU32(m.id) && d.reader.readString(m.text);
            return d.finish(ok, ReplyMessage{std::move(m)});
        }
    }
}

std::string_view replyMessageName(const ReplyMessage& msg) noexcept {
    switch (msg.index()) {
        case 0: return "Id";
        case 1: return "DBusError";
        case 2: return "UnknownError";
        case 3: return "Dismissed";
        case 4: return "ActionInvoked";
        case 5: return "ServerRestart";
        case 6: return "Replied";
        default: return "Unknown";
    }
}

} // namespace gnb::protocol
