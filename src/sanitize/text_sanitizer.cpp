/// @file text_sanitizer.cpp
/// @brief Text sanitizer and code point safety table.

#include "gnb/sanitize/text_sanitizer.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

namespace gnb::sanitize {

namespace {

struct CodePointRange {
    char32_t first;
    char32_t last;
};

// Sorted, non-overlapping ranges of code points never shown verbatim.
// Plane-final noncharacters (U+xFFFE, U+xFFFF) are handled separately.
constexpr std::array<CodePointRange, 23> kUnsafeRanges = {{
    {0x0000, 0x001F},    // C0 controls
    {0x007F, 0x009F},    // DEL, C1 controls
    {0x00AD, 0x00AD},    // soft hyphen
    {0x034F, 0x034F},    // combining grapheme joiner
    {0x061C, 0x061C},    // Arabic letter mark
    {0x115F, 0x1160},    // Hangul choseong/jungseong fillers
    {0x17B4, 0x17B5},    // Khmer inherent vowels
    {0x180B, 0x180F},    // Mongolian variation selectors and vowel separator
    {0x200B, 0x200F},    // zero-width space/joiners, LRM, RLM
    {0x2028, 0x202E},    // line/paragraph separator, bidi embeddings
    {0x2060, 0x206F},    // word joiner, invisible operators, bidi isolates
    {0x3164, 0x3164},    // Hangul filler
    {0xD800, 0xDFFF},    // surrogates
    {0xE000, 0xF8FF},    // private use area
    {0xFDD0, 0xFDEF},    // noncharacters
    {0xFE00, 0xFE0F},    // variation selectors
    {0xFEFF, 0xFEFF},    // zero-width no-break space
    {0xFFA0, 0xFFA0},    // halfwidth Hangul filler
    {0xFFF9, 0xFFFB},    // interlinear annotation controls
    {0x110BD, 0x110BD},  // Kaithi number sign
    {0x13430, 0x1343F},  // Egyptian hieroglyph format controls
    {0x1BCA0, 0x1BCA3},  // shorthand format controls
    {0x1D173, 0x1D17A},  // musical symbol format controls
}};

constexpr char32_t kFirstUnsafePlaneStart = 0x40000;

// ---------------------------------------------------------------------------
// UTF-8
// ---------------------------------------------------------------------------

/// Decode one code point starting at @p pos and advance past it.
/// Malformed input yields U+FFFD and consumes the maximal invalid prefix
/// (at least one byte), so decoding always makes progress.
char32_t decodeNext(std::string_view in, std::size_t& pos) {
    auto byte = [&](std::size_t i) { return static_cast<uint8_t>(in[i]); };

    uint8_t lead = byte(pos);
    if (lead < 0x80) {
        ++pos;
        return lead;
    }

    std::size_t need = 0;
    char32_t cp = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
        cp = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 2;
        cp = lead & 0x0F;
        if (lead == 0xE0) lo = 0xA0;       // overlong
        else if (lead == 0xED) hi = 0x9F;  // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 3;
        cp = lead & 0x07;
        if (lead == 0xF0) lo = 0x90;       // overlong
        else if (lead == 0xF4) hi = 0x8F;  // above U+10FFFF
    } else {
        ++pos;
        return kReplacementCharacter;
    }

    std::size_t i = pos + 1;
    for (std::size_t k = 0; k < need; ++k, ++i) {
        if (i >= in.size()) {
            pos = i;
            return kReplacementCharacter;
        }
        uint8_t b = byte(i);
        uint8_t min = (k == 0) ? lo : 0x80;
        uint8_t max = (k == 0) ? hi : 0xBF;
        if (b < min || b > max) {
            pos = i;
            return kReplacementCharacter;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    pos = i;
    return cp;
}

void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

bool isCodePointSafeForDisplay(char32_t cp) noexcept {
    if (cp >= kFirstUnsafePlaneStart) {
        return false;
    }
    if ((cp & 0xFFFE) == 0xFFFE) {
        return false;
    }
    auto it = std::upper_bound(
        kUnsafeRanges.begin(), kUnsafeRanges.end(), cp,
        [](char32_t value, const CodePointRange& r) { return value < r.first; });
    if (it == kUnsafeRanges.begin()) {
        return true;
    }
    --it;
    return cp > it->last;
}

std::string sanitizeText(std::string_view untrusted) {
    std::string out;
    out.reserve(untrusted.size());

    std::size_t pos = 0;
    std::size_t counter = 0;
    std::size_t lines = 0;
    while (pos < untrusted.size()) {
        char32_t c = decodeNext(untrusted, pos);
        if (c == U'\t' || isCodePointSafeForDisplay(c)) {
            ++counter;
            appendUtf8(out, c);
        } else if (c == U'\n') {
            counter = 0;
            ++lines;
            out += '\n';
        } else if (c == U'\r') {
            if (pos < untrusted.size() && untrusted[pos] == '\n') {
                continue;
            }
            counter = 0;
            ++lines;
            out += '\n';
        } else {
            ++counter;
            appendUtf8(out, kReplacementCharacter);
        }

        if (counter >= kMaxCharsPerLine) {
            out += '\n';
            counter = 0;
            ++lines;
        }
        if (lines >= kMaxLines) {
            break;
        }
    }
    return out;
}

} // namespace gnb::sanitize
