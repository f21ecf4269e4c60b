#pragma once

/// @file text_sanitizer.hpp
/// @brief Reduction of untrusted text to a safe, bounded subset of Unicode.
///
/// Notification daemons render whatever they are given. Text coming from a
/// guest is therefore restricted before it reaches the host:
///
/// - Only code points safe for display (plus tab and newline) survive;
///   everything else, including malformed UTF-8, becomes U+FFFD.
/// - "\r\n" collapses to "\n" and a lone "\r" becomes "\n".
/// - Lines are hard-wrapped at kMaxCharsPerLine code points.
/// - Output stops once kMaxLines line breaks have been emitted. Some
///   daemons spin at 100% CPU when handed thousands of lines.

#include <cstddef>
#include <string>
#include <string_view>

namespace gnb::sanitize {

inline constexpr std::size_t kMaxLines = 500;
inline constexpr std::size_t kMaxCharsPerLine = 1000;

inline constexpr char32_t kReplacementCharacter = U'\uFFFD';

/// True if @p cp may be shown to the user verbatim.
///
/// Rejects control characters, surrogates, noncharacters, private use,
/// invisible formatting and bidi controls, line/paragraph separators,
/// variation selectors, and every code point from U+40000 upward (tags,
/// supplementary private use, and planes with no assigned scripts).
[[nodiscard]] bool isCodePointSafeForDisplay(char32_t cp) noexcept;

/// Sanitize untrusted UTF-8 text. The result is always valid UTF-8.
[[nodiscard]] std::string sanitizeText(std::string_view untrusted);

} // namespace gnb::sanitize
