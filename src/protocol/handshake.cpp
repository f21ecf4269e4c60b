/// @file handshake.cpp
/// @brief Version handshake implementation.

#include "gnb/protocol/handshake.hpp"

#include <algorithm>
#include <array>
#include <string>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/protocol/frame_channel.hpp"
#include "gnb/protocol/wire_codec.hpp"

namespace gnb::protocol {

using foundation::BridgeError;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

BridgeResult<void> writeVersion(int fd, ProtocolVersion v) {
    WireWriter w;
    w.writeU32(mergeVersions(v.major, v.minor));
    return writeAll(fd, w.buffer());
}

BridgeResult<uint32_t> readVersion(int fd) {
    std::array<uint8_t, 4> raw{};
    auto r = readExact(fd, raw);
    if (r.hasError()) {
        return BridgeResult<uint32_t>::err(r.error());
    }
    WireReader reader(raw);
    uint32_t value = 0;
    (void)reader.readU32(value);  // exactly four bytes available
    return BridgeResult<uint32_t>::ok(value);
}

BridgeError mismatch(uint16_t peerMajor, uint16_t ownMajor) {
    return BridgeError(ErrorCode::VersionMismatch,
                       "major version mismatch: peer speaks " + std::to_string(peerMajor) +
                           ", we speak " + std::to_string(ownMajor));
}

} // namespace

BridgeResult<ProtocolVersion> negotiateVersion(uint32_t peerVersion,
                                               ProtocolVersion own) {
    auto [peerMajor, peerMinor] = splitVersion(peerVersion);
    if (peerMajor != own.major) {
        return BridgeResult<ProtocolVersion>::err(mismatch(peerMajor, own.major));
    }
    return BridgeResult<ProtocolVersion>::ok(
        ProtocolVersion{own.major, std::min(peerMinor, own.minor)});
}

BridgeResult<ProtocolVersion> hostHandshake(int inFd, int outFd, ProtocolVersion own) {
    auto sent = writeVersion(outFd, own);
    if (sent.hasError()) {
        return BridgeResult<ProtocolVersion>::err(sent.error());
    }

    auto reply = readVersion(inFd);
    if (reply.hasError()) {
        return BridgeResult<ProtocolVersion>::err(reply.error());
    }

    auto [major, minor] = splitVersion(reply.value());
    if (major != own.major) {
        return BridgeResult<ProtocolVersion>::err(mismatch(major, own.major));
    }
    if (minor > own.minor) {
        return BridgeResult<ProtocolVersion>::err(BridgeError(
            ErrorCode::ProtocolViolation,
            "guest chose minor version " + std::to_string(minor) +
                " above the offered " + std::to_string(own.minor)));
    }

    GNB_LOG_INFO(LogCategory::Protocol,
                 "negotiated protocol version " + std::to_string(major) + "." +
                     std::to_string(minor));
    return BridgeResult<ProtocolVersion>::ok(ProtocolVersion{major, minor});
}

BridgeResult<ProtocolVersion> guestHandshake(int inFd, int outFd, ProtocolVersion own) {
    auto announced = readVersion(inFd);
    if (announced.hasError()) {
        return BridgeResult<ProtocolVersion>::err(announced.error());
    }

    auto peerMinor = splitVersion(announced.value()).second;
    ProtocolVersion answer{own.major, std::min(peerMinor, own.minor)};
    auto sent = writeVersion(outFd, answer);
    if (sent.hasError()) {
        return BridgeResult<ProtocolVersion>::err(sent.error());
    }

    auto negotiated = negotiateVersion(announced.value(), own);
    if (negotiated.hasValue()) {
        GNB_LOG_INFO(LogCategory::Protocol,
                     "negotiated protocol version " +
                         std::to_string(negotiated.value().major) + "." +
                         std::to_string(negotiated.value().minor));
    }
    return negotiated;
}

} // namespace gnb::protocol
