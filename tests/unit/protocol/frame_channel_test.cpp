#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <csignal>
#include <cstdint>
#include <vector>

#include "gnb/protocol/frame_channel.hpp"

using namespace gnb::protocol;
using gnb::foundation::ErrorCode;

namespace {

class Pipe {
public:
    Pipe() {
        int fds[2] = {-1, -1};
        if (::pipe(fds) == 0) {
            readFd = fds[0];
            writeFd = fds[1];
        }
    }
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    void closeRead() {
        if (readFd >= 0) ::close(readFd);
        readFd = -1;
    }
    void closeWrite() {
        if (writeFd >= 0) ::close(writeFd);
        writeFd = -1;
    }

    int readFd = -1;
    int writeFd = -1;
};

} // namespace

// ---------------------------------------------------------------------------
// encodeFrame / FrameDecoder
// ---------------------------------------------------------------------------

TEST(FrameDecoderTest, EncodeAddsLengthPrefix) {
    std::vector<uint8_t> payload{0xAA, 0xBB};
    EXPECT_EQ(encodeFrame(payload), (std::vector<uint8_t>{2, 0, 0, 0, 0xAA, 0xBB}));
}

TEST(FrameDecoderTest, ByteByByte) {
    std::vector<uint8_t> payload{1, 2, 3};
    auto frame = encodeFrame(payload);

    FrameDecoder decoder;
    for (std::size_t i = 0; i + 1 < frame.size(); ++i) {
        decoder.feed(std::span<const uint8_t>(&frame[i], 1));
        auto next = decoder.next();
        ASSERT_TRUE(next.hasValue());
        EXPECT_FALSE(next.value().has_value());
    }
    decoder.feed(std::span<const uint8_t>(&frame.back(), 1));
    auto next = decoder.next();
    ASSERT_TRUE(next.hasValue());
    ASSERT_TRUE(next.value().has_value());
    EXPECT_EQ(*next.value(), payload);
    EXPECT_EQ(decoder.buffered(), 0u);
}

TEST(FrameDecoderTest, SeveralFramesInOneChunk) {
    auto a = encodeFrame(std::vector<uint8_t>{1});
    auto b = encodeFrame(std::vector<uint8_t>{});
    auto c = encodeFrame(std::vector<uint8_t>{2, 3});
    std::vector<uint8_t> stream;
    stream.insert(stream.end(), a.begin(), a.end());
    stream.insert(stream.end(), b.begin(), b.end());
    stream.insert(stream.end(), c.begin(), c.end());

    FrameDecoder decoder;
    decoder.feed(stream);
    std::vector<std::vector<uint8_t>> out;
    for (;;) {
        auto next = decoder.next();
        ASSERT_TRUE(next.hasValue());
        if (!next.value()) break;
        out.push_back(*next.value());
    }
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], (std::vector<uint8_t>{1}));
    EXPECT_TRUE(out[1].empty());
    EXPECT_EQ(out[2], (std::vector<uint8_t>{2, 3}));
}

TEST(FrameDecoderTest, OversizedLengthRejectedBeforePayload) {
    FrameDecoder decoder(16);
    std::vector<uint8_t> prefix{17, 0, 0, 0};
    decoder.feed(prefix);
    auto next = decoder.next();
    ASSERT_TRUE(next.hasError());
    EXPECT_EQ(next.error().code(), ErrorCode::MessageTooLarge);
}

TEST(FrameDecoderTest, DefaultLimitIsSixteenMiB) {
    FrameDecoder decoder;
    std::vector<uint8_t> prefix{0x01, 0x00, 0x00, 0x01};  // 0x1000001
    decoder.feed(prefix);
    auto next = decoder.next();
    ASSERT_TRUE(next.hasError());
    EXPECT_EQ(next.error().code(), ErrorCode::MessageTooLarge);

    FrameDecoder exact;
    std::vector<uint8_t> limit{0x00, 0x00, 0x00, 0x01};  // 0x1000000
    exact.feed(limit);
    auto pending = exact.next();
    ASSERT_TRUE(pending.hasValue());
    EXPECT_FALSE(pending.value().has_value());
}

// ---------------------------------------------------------------------------
// Descriptor I/O
// ---------------------------------------------------------------------------

TEST(FrameChannelTest, WriterAndReadAvailable) {
    Pipe pipe;
    ASSERT_GE(pipe.readFd, 0);

    FdFrameWriter writer(pipe.writeFd);
    std::vector<uint8_t> payload{'h', 'i'};
    ASSERT_TRUE(writer.send(payload).hasValue());

    FrameDecoder decoder;
    auto more = readAvailable(pipe.readFd, decoder);
    ASSERT_TRUE(more.hasValue());
    EXPECT_TRUE(more.value());

    auto next = decoder.next();
    ASSERT_TRUE(next.hasValue());
    ASSERT_TRUE(next.value().has_value());
    EXPECT_EQ(*next.value(), payload);
}

TEST(FrameChannelTest, ReadAvailableReportsEof) {
    Pipe pipe;
    pipe.closeWrite();
    FrameDecoder decoder;
    auto more = readAvailable(pipe.readFd, decoder);
    ASSERT_TRUE(more.hasValue());
    EXPECT_FALSE(more.value());
}

TEST(FrameChannelTest, ReadAvailableNonBlockingEmpty) {
    Pipe pipe;
    ASSERT_EQ(::fcntl(pipe.readFd, F_SETFL, O_NONBLOCK), 0);
    FrameDecoder decoder;
    auto more = readAvailable(pipe.readFd, decoder);
    ASSERT_TRUE(more.hasValue());
    EXPECT_TRUE(more.value());
    EXPECT_EQ(decoder.buffered(), 0u);
}

TEST(FrameChannelTest, ReadExactEofIsChannelClosed) {
    Pipe pipe;
    std::array<uint8_t, 2> partial{1, 2};
    ASSERT_TRUE(writeAll(pipe.writeFd, partial).hasValue());
    pipe.closeWrite();

    std::array<uint8_t, 4> buf{};
    auto result = readExact(pipe.readFd, buf);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ChannelClosed);
}

TEST(FrameChannelTest, WriteToClosedPipeIsChannelClosed) {
    Pipe pipe;
    pipe.closeRead();
    // SIGPIPE is ignored by the executables; do the same here.
    auto previous = std::signal(SIGPIPE, SIG_IGN);
    std::array<uint8_t, 1> byte{0};
    auto result = writeAll(pipe.writeFd, byte);
    std::signal(SIGPIPE, previous);

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ChannelClosed);
}

TEST(FrameChannelTest, WriterRefusesOversizedPayload) {
    Pipe pipe;
    FdFrameWriter writer(pipe.writeFd);
    std::vector<uint8_t> huge(kMaxMessageSize + 1);
    auto result = writer.send(huge);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MessageTooLarge);
}
