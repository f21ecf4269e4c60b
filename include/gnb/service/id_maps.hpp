#pragma once

/// @file id_maps.hpp
/// @brief Bijection between guest-visible and host notification IDs.
///
/// The guest never sees host IDs. Guest IDs come from a private counter
/// so that a guest cannot probe or guess notifications created by other
/// domains, and so that a host server restart does not make old and new
/// notifications collide in the guest's view.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

#include "gnb/foundation/types.hpp"

namespace gnb::service {

using foundation::GuestId;
using foundation::HostId;

class IdMaps {
public:
    /// Record that @p host now backs a guest notification.
    ///
    /// With @p replaces set, the existing guest ID is kept and re-pointed
    /// at @p host. Otherwise a fresh guest ID is allocated: the counter
    /// starts at 1, wraps from UINT32_MAX to 1 and skips IDs in use, so the
    /// first ID handed out is 2.
    ///
    /// If the server reused @p host while it is still mapped to another
    /// guest ID, the stale mapping is evicted.
    /// @pre host.isValid() and, if set, replaces->isValid().
    GuestId assign(HostId host, std::optional<GuestId> replaces = std::nullopt);

    [[nodiscard]] std::optional<HostId> lookupGuest(GuestId guest) const;

    [[nodiscard]] std::optional<GuestId> lookupHost(HostId host) const;

    /// Forget the mapping of a closed host notification.
    /// @return The guest ID it was mapped to, if any.
    std::optional<GuestId> removeHost(HostId host);

    /// Drop every mapping. The ID counter keeps running.
    void clear() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return guestToHost_.size(); }

    [[nodiscard]] bool empty() const noexcept { return guestToHost_.empty(); }

private:
    GuestId allocateGuestId();

    std::unordered_map<GuestId, HostId> guestToHost_;
    std::unordered_map<HostId, GuestId> hostToGuest_;
    uint32_t lastId_ = 1;
};

} // namespace gnb::service
