#pragma once

/// @file capabilities.hpp
/// @brief Capability set advertised by a notification server.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gnb::service {

/// Capabilities defined by the Desktop Notifications specification, plus
/// the KDE "inline-reply" extension.
enum class Capability : uint16_t {
    Body           = 1u << 0,
    BodyHyperlinks = 1u << 1,
    BodyMarkup     = 1u << 2,
    Persistence    = 1u << 3,
    Sound          = 1u << 4,
    BodyImages     = 1u << 5,
    IconMulti      = 1u << 6,
    IconStatic     = 1u << 7,
    Actions        = 1u << 8,
    ActionIcons    = 1u << 9,
    InlineReply    = 1u << 10
};

/// Map a GetCapabilities string to a Capability.
[[nodiscard]] std::optional<Capability> capabilityFromName(std::string_view name) noexcept;

[[nodiscard]] std::string_view capabilityName(Capability cap) noexcept;

class Capabilities {
public:
    constexpr Capabilities() noexcept = default;

    /// Build from the strings returned by GetCapabilities.
    /// Unknown strings are logged and otherwise ignored.
    static Capabilities parse(const std::vector<std::string>& names);

    [[nodiscard]] constexpr bool has(Capability cap) const noexcept {
        return (bits_ & static_cast<uint16_t>(cap)) != 0;
    }

    constexpr void add(Capability cap) noexcept { bits_ |= static_cast<uint16_t>(cap); }

    [[nodiscard]] constexpr uint16_t bits() const noexcept { return bits_; }

    /// Names of the set capabilities, in declaration order.
    [[nodiscard]] std::vector<std::string> names() const;

    constexpr bool operator==(const Capabilities&) const noexcept = default;

private:
    uint16_t bits_ = 0;
};

} // namespace gnb::service
