/// @file id_maps.cpp
/// @brief IdMaps implementation.

#include "gnb/service/id_maps.hpp"

#include <limits>
#include <string>

#include "gnb/foundation/bridge_logger.hpp"

namespace gnb::service {

using foundation::LogCategory;

namespace {

constexpr uint32_t nextCounter(uint32_t id) noexcept {
    return id == std::numeric_limits<uint32_t>::max() ? 1 : id + 1;
}

} // namespace

GuestId IdMaps::allocateGuestId() {
    lastId_ = nextCounter(lastId_);
    while (guestToHost_.count(GuestId(lastId_)) > 0) {
        lastId_ = nextCounter(lastId_);
    }
    return GuestId(lastId_);
}

GuestId IdMaps::assign(HostId host, std::optional<GuestId> replaces) {
    // A server may hand out an ID again without having sent
    // NotificationClosed for its previous use.
    if (auto it = hostToGuest_.find(host); it != hostToGuest_.end()) {
        if (!replaces || it->second != *replaces) {
            GNB_LOG_WARN(LogCategory::Host,
                         "notification server reused host ID " +
                             std::to_string(host.value()) + ", dropping stale guest ID " +
                             std::to_string(it->second.value()));
            guestToHost_.erase(it->second);
            hostToGuest_.erase(it);
        }
    }

    if (replaces) {
        if (auto it = guestToHost_.find(*replaces); it != guestToHost_.end()) {
            if (it->second != host) {
                hostToGuest_.erase(it->second);
            }
        }
        guestToHost_[*replaces] = host;
        hostToGuest_[host] = *replaces;
        return *replaces;
    }

    auto guest = allocateGuestId();
    guestToHost_.emplace(guest, host);
    hostToGuest_.emplace(host, guest);
    GNB_LOG_DEBUG(LogCategory::Host,
                  "guest ID " + std::to_string(guest.value()) + " maps to host ID " +
                      std::to_string(host.value()));
    return guest;
}

std::optional<HostId> IdMaps::lookupGuest(GuestId guest) const {
    auto it = guestToHost_.find(guest);
    if (it == guestToHost_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<GuestId> IdMaps::lookupHost(HostId host) const {
    auto it = hostToGuest_.find(host);
    if (it == hostToGuest_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<GuestId> IdMaps::removeHost(HostId host) {
    auto it = hostToGuest_.find(host);
    if (it == hostToGuest_.end()) {
        return std::nullopt;
    }
    auto guest = it->second;
    hostToGuest_.erase(it);
    guestToHost_.erase(guest);
    return guest;
}

void IdMaps::clear() noexcept {
    guestToHost_.clear();
    hostToGuest_.clear();
}

} // namespace gnb::service
