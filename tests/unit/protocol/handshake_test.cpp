#include <gtest/gtest.h>

#include <unistd.h>

#include <array>
#include <cstdint>
#include <thread>

#include "gnb/protocol/frame_channel.hpp"
#include "gnb/protocol/handshake.hpp"
#include "gnb/protocol/wire_codec.hpp"

using namespace gnb::protocol;
using gnb::foundation::ErrorCode;

namespace {

/// Two pipes forming a bidirectional channel between host and guest.
struct Channel {
    Channel() {
        int a[2] = {-1, -1};
        int b[2] = {-1, -1};
        if (::pipe(a) == 0 && ::pipe(b) == 0) {
            guestIn = a[0];
            hostOut = a[1];
            hostIn = b[0];
            guestOut = b[1];
        }
    }
    ~Channel() {
        for (int fd : {hostIn, hostOut, guestIn, guestOut}) {
            if (fd >= 0) ::close(fd);
        }
    }
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    int hostIn = -1;
    int hostOut = -1;
    int guestIn = -1;
    int guestOut = -1;
};

void writeRaw(int fd, uint32_t value) {
    WireWriter w;
    w.writeU32(value);
    ASSERT_TRUE(writeAll(fd, w.buffer()).hasValue());
}

uint32_t readRaw(int fd) {
    std::array<uint8_t, 4> raw{};
    if (!readExact(fd, raw)) {
        return 0xFFFFFFFF;
    }
    WireReader r(raw);
    uint32_t value = 0;
    (void)r.readU32(value);
    return value;
}

} // namespace

TEST(NegotiateVersionTest, SameVersion) {
    auto v = negotiateVersion(mergeVersions(1, 0), {1, 0});
    ASSERT_TRUE(v.hasValue());
    EXPECT_EQ(v.value(), (ProtocolVersion{1, 0}));
}

TEST(NegotiateVersionTest, PicksLowerMinor) {
    auto newerPeer = negotiateVersion(mergeVersions(1, 5), {1, 2});
    ASSERT_TRUE(newerPeer.hasValue());
    EXPECT_EQ(newerPeer.value().minor, 2);

    auto olderPeer = negotiateVersion(mergeVersions(1, 1), {1, 2});
    ASSERT_TRUE(olderPeer.hasValue());
    EXPECT_EQ(olderPeer.value().minor, 1);
}

TEST(NegotiateVersionTest, MajorMismatch) {
    auto v = negotiateVersion(mergeVersions(2, 0), {1, 0});
    ASSERT_TRUE(v.hasError());
    EXPECT_EQ(v.error().code(), ErrorCode::VersionMismatch);
}

TEST(HandshakeTest, HostAndGuestAgree) {
    Channel ch;
    BridgeResult<ProtocolVersion> guestResult =
        BridgeResult<ProtocolVersion>::err(gnb::foundation::BridgeError());
    std::thread guest([&] {
        guestResult = guestHandshake(ch.guestIn, ch.guestOut, {1, 0});
    });
    auto hostResult = hostHandshake(ch.hostIn, ch.hostOut, {1, 3});
    guest.join();

    ASSERT_TRUE(hostResult.hasValue()) << hostResult.error().message();
    ASSERT_TRUE(guestResult.hasValue());
    EXPECT_EQ(hostResult.value(), (ProtocolVersion{1, 0}));
    EXPECT_EQ(guestResult.value(), (ProtocolVersion{1, 0}));
}

TEST(HandshakeTest, HostSendsFirst) {
    Channel ch;
    writeRaw(ch.guestOut, mergeVersions(1, 0));
    auto result = hostHandshake(ch.hostIn, ch.hostOut, {1, 0});
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(readRaw(ch.guestIn), mergeVersions(1, 0));
}

TEST(HandshakeTest, GuestAnswersEvenOnMismatch) {
    Channel ch;
    writeRaw(ch.hostOut, mergeVersions(2, 4));
    auto result = guestHandshake(ch.guestIn, ch.guestOut, {1, 0});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::VersionMismatch);
    EXPECT_EQ(readRaw(ch.hostIn), mergeVersions(1, 0));
}

TEST(HandshakeTest, HostRejectsWrongMajor) {
    Channel ch;
    writeRaw(ch.guestOut, mergeVersions(3, 0));
    auto result = hostHandshake(ch.hostIn, ch.hostOut, {1, 0});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::VersionMismatch);
}

TEST(HandshakeTest, HostRejectsMinorAboveOffer) {
    Channel ch;
    writeRaw(ch.guestOut, mergeVersions(1, 9));
    auto result = hostHandshake(ch.hostIn, ch.hostOut, {1, 0});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ProtocolViolation);
}

TEST(HandshakeTest, GuestSeesEof) {
    Channel ch;
    ::close(ch.hostOut);
    ch.hostOut = -1;
    auto result = guestHandshake(ch.guestIn, ch.guestOut, {1, 0});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ChannelClosed);
}
