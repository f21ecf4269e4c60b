#pragma once

/// @file types.hpp
/// @brief Strong ID types for notification identifiers.

#include <compare>
#include <cstdint>
#include <functional>

namespace gnb::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Guest-visible and host-side notification IDs share a representation
/// (the D-Bus `u` type) but must never be mixed up: handing a host ID to
/// the guest would leak host state, and the reverse would close the wrong
/// notification.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint32_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }

    /// Zero means "no notification" in the D-Bus notification protocol.
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct GuestIdTag {};
struct HostIdTag {};

/// Notification ID as seen by applications in the guest.
using GuestId = StrongId<GuestIdTag>;

/// Notification ID assigned by the host notification server.
using HostId = StrongId<HostIdTag>;

} // namespace gnb::foundation

template <typename Tag, typename T>
struct std::hash<gnb::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const gnb::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
