#pragma once

/// @file handshake.hpp
/// @brief Protocol version negotiation run once before any frame.
///
/// The host speaks first with its merged (major, minor) version as a bare
/// little-endian u32. The guest answers with (its major, min(minors)).
/// Both sides refuse to continue on a major version mismatch.

#include <cstdint>

#include "gnb/foundation/bridge_result.hpp"
#include "gnb/protocol/messages.hpp"

namespace gnb::protocol {

using foundation::BridgeResult;

struct ProtocolVersion {
    uint16_t major = kMajorVersion;
    uint16_t minor = kMinorVersion;

    bool operator==(const ProtocolVersion&) const = default;
};

/// Compute the guest's answer to the version the host announced.
/// @return The negotiated version or VersionMismatch.
[[nodiscard]] BridgeResult<ProtocolVersion> negotiateVersion(
    uint32_t peerVersion, ProtocolVersion own = {});

/// Host side: announce our version, then read and check the guest's reply.
BridgeResult<ProtocolVersion> hostHandshake(int inFd, int outFd,
                                            ProtocolVersion own = {});

/// Guest side: read the host's version and reply with the negotiated one.
/// The reply is sent even on a major mismatch so the host can report it.
BridgeResult<ProtocolVersion> guestHandshake(int inFd, int outFd,
                                             ProtocolVersion own = {});

} // namespace gnb::protocol
