#pragma once

/// @file notification_validator.hpp
/// @brief Validation of untrusted notification fields.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "gnb/foundation/bridge_result.hpp"
#include "gnb/protocol/messages.hpp"

namespace gnb::sanitize {

using foundation::BridgeResult;

// -- Action names ------------------------------------------------------------

inline constexpr std::size_t kMaxActionNameLength = 255;

/// True if @p action is 1-255 bytes, starts with an ASCII letter and
/// continues with ASCII letters, digits, '-', '.' or '_'.
[[nodiscard]] bool isValidActionName(std::string_view action) noexcept;

/// Same rule as isValidActionName(), reporting which part failed.
/// @return Success or InvalidActionName with a description.
BridgeResult<void> checkActionName(std::string_view action);

// -- Categories --------------------------------------------------------------

inline constexpr std::size_t kMaxCategoryLength = 64;

/// Validate a notification category ("im.received", "email", ...).
///
/// Accepts at most 64 bytes of lowercase ASCII letters and dots, starting
/// with a letter and not ending with a dot.
/// @return The category unchanged, or InvalidCategory.
BridgeResult<std::string> validateCategory(std::string_view untrusted);

// -- Markup ------------------------------------------------------------------

/// Escape the five XML special characters so the text renders literally
/// on servers that interpret body markup.
[[nodiscard]] std::string escapeMarkup(std::string_view text);

// -- Images ------------------------------------------------------------------

inline constexpr std::size_t kMaxImageDataSize = std::size_t{1} << 21;  // 2 MiB
inline constexpr int32_t kMaxImageWidth = 255;
inline constexpr int32_t kMaxImageHeight = 255;

/// Image that passed validateImage(), in "(iiibiiay)" field order.
struct ValidatedImage {
    int32_t width = 0;
    int32_t height = 0;
    int32_t rowstride = 0;
    bool hasAlpha = false;
    int32_t bitsPerSample = 0;
    int32_t channels = 0;
    std::vector<uint8_t> data;

    bool operator==(const ValidatedImage&) const = default;
};

/// Check that an untrusted image is small and self-consistent.
///
/// Checks run in a fixed order and the first failure is reported:
/// bits per sample, data size, channel count, minimum dimensions,
/// maximum dimensions, buffer fit, then row stride.
/// @return The validated image, or InvalidImage with a fixed message.
BridgeResult<ValidatedImage> validateImage(protocol::ImageParameters untrusted);

} // namespace gnb::sanitize
