/// @file notification_validator.cpp
/// @brief Action name, category, markup and image validation.

#include "gnb/sanitize/notification_validator.hpp"

#include <string>

namespace gnb::sanitize {

using foundation::BridgeError;
using foundation::ErrorCode;

namespace {

constexpr bool isAsciiLetter(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr bool isActionNameChar(char c) noexcept {
    return isAsciiLetter(c) || (c >= '0' && c <= '9') || c == '-' || c == '.' ||
           c == '_';
}

/// Printable rendering of an untrusted name for error messages.
std::string quoteBytes(std::string_view s) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out = "\"";
    for (char c : s.substr(0, 64)) {
        auto u = static_cast<unsigned char>(c);
        if (u >= 0x20 && u < 0x7F && c != '"' && c != '\\') {
            out += c;
        } else {
            out += "\\x";
            out += kHex[u >> 4];
            out += kHex[u & 0xF];
        }
    }
    if (s.size() > 64) out += "...";
    out += '"';
    return out;
}

BridgeResult<ValidatedImage> imageError(const char* message) {
    return BridgeResult<ValidatedImage>::err(BridgeError(ErrorCode::InvalidImage, message));
}

} // namespace

// ---------------------------------------------------------------------------
// Action names
// ---------------------------------------------------------------------------

bool isValidActionName(std::string_view action) noexcept {
    if (action.empty() || action.size() > kMaxActionNameLength) {
        return false;
    }
    if (!isAsciiLetter(action[0])) {
        return false;
    }
    for (char c : action.substr(1)) {
        if (!isActionNameChar(c)) {
            return false;
        }
    }
    return true;
}

BridgeResult<void> checkActionName(std::string_view action) {
    auto fail = [](std::string message) {
        return BridgeResult<void>::err(
            BridgeError(ErrorCode::InvalidActionName, std::move(message)));
    };

    if (action.empty()) {
        return fail("empty action name refused");
    }
    if (action.size() > kMaxActionNameLength) {
        return fail("action " + quoteBytes(action) + " is longer than " +
                    std::to_string(kMaxActionNameLength) + " bytes");
    }
    if (!isAsciiLetter(action[0])) {
        return fail("action " + quoteBytes(action) +
                    " does not start with an ASCII letter");
    }
    for (std::size_t i = 1; i < action.size(); ++i) {
        if (!isActionNameChar(action[i])) {
            return fail("action " + quoteBytes(action) + " has a forbidden byte at position " +
                        std::to_string(i));
        }
    }
    return BridgeResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Categories
// ---------------------------------------------------------------------------

BridgeResult<std::string> validateCategory(std::string_view untrusted) {
    auto invalid = [] {
        return BridgeResult<std::string>::err(
            BridgeError(ErrorCode::InvalidCategory, "Invalid category"));
    };

    if (untrusted.empty() || untrusted.size() > kMaxCategoryLength) {
        return invalid();
    }
    if (untrusted.front() < 'a' || untrusted.front() > 'z') {
        return invalid();
    }
    for (char c : untrusted.substr(1)) {
        if (!((c >= 'a' && c <= 'z') || c == '.')) {
            return invalid();
        }
    }
    if (untrusted.back() == '.') {
        return invalid();
    }
    return BridgeResult<std::string>::ok(std::string(untrusted));
}

// ---------------------------------------------------------------------------
// Markup
// ---------------------------------------------------------------------------

std::string escapeMarkup(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '&':  out += "&amp;"; break;
            case '\'': out += "&apos;"; break;
            case '"':  out += "&quot;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Images
// ---------------------------------------------------------------------------

BridgeResult<ValidatedImage> validateImage(protocol::ImageParameters untrusted) {
    const bool hasAlpha = untrusted.untrustedHasAlpha;

    if (untrusted.untrustedBitsPerSample != 8) {
        return imageError("Wrong number of bits per sample");
    }
    if (untrusted.untrustedData.size() > kMaxImageDataSize) {
        return imageError("Too much data");
    }

    const int32_t channels = 3 + (hasAlpha ? 1 : 0);
    if (untrusted.untrustedChannels != channels) {
        return imageError("Wrong number of channels");
    }

    const int32_t width = untrusted.untrustedWidth;
    const int32_t height = untrusted.untrustedHeight;
    const int32_t rowstride = untrusted.untrustedRowstride;
    if (width < 1 || height < 1 || rowstride < channels) {
        return imageError("Too small width, height, or stride");
    }
    if (width > kMaxImageWidth || height > kMaxImageHeight) {
        return imageError("Width or height too large");
    }

    // Data size is bounded by kMaxImageDataSize, so this fits in int32_t.
    const auto dataSize = static_cast<int32_t>(untrusted.untrustedData.size());
    if (dataSize / height < rowstride) {
        return imageError("Image too large");
    }
    if (rowstride / channels < width) {
        return imageError("Row stride too small");
    }

    ValidatedImage image;
    image.width = width;
    image.height = height;
    image.rowstride = rowstride;
    image.hasAlpha = hasAlpha;
    image.bitsPerSample = 8;
    image.channels = channels;
    image.data = std::move(untrusted.untrustedData);
    return BridgeResult<ValidatedImage>::ok(std::move(image));
}

} // namespace gnb::sanitize
