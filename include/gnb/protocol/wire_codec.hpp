#pragma once

/// @file wire_codec.hpp
/// @brief Fixed-width little-endian primitives of the bridge wire format.
///
/// Layout per type:
///   bool, u8      1 byte (bool must be 0 or 1)
///   u32, i32      4 bytes, little-endian
///   u64           8 bytes, little-endian
///   string/bytes  u64 length followed by the raw bytes
///   string list   u64 count followed by each string
///
/// Options and enum discriminants are composed from these by the message
/// codec. Integers are assembled byte by byte so the encoding does not
/// depend on host byte order.

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace gnb::protocol {

/// Append-only encoder into an owned byte buffer.
class WireWriter {
public:
    void writeU8(uint8_t value);
    void writeBool(bool value);
    void writeU32(uint32_t value);
    void writeI32(int32_t value);
    void writeU64(uint64_t value);
    void writeString(const std::string& value);
    void writeBytes(std::span<const uint8_t> value);
    void writeStringList(const std::vector<std::string>& values);

    [[nodiscard]] const std::vector<uint8_t>& buffer() const noexcept { return buf_; }
    std::vector<uint8_t> take() noexcept { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

/// Bounds-checked decoder over a borrowed byte span.
///
/// Every read returns false (and leaves the output unspecified) when the
/// input is too short or malformed. Length prefixes are checked against
/// the remaining input before any allocation, so a hostile length cannot
/// trigger a large allocation.
class WireReader {
public:
    explicit WireReader(std::span<const uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] bool readU8(uint8_t& out);
    [[nodiscard]] bool readBool(bool& out);
    [[nodiscard]] bool readU32(uint32_t& out);
    [[nodiscard]] bool readI32(int32_t& out);
    [[nodiscard]] bool readU64(uint64_t& out);
    [[nodiscard]] bool readString(std::string& out);
    [[nodiscard]] bool readBytes(std::vector<uint8_t>& out);
    [[nodiscard]] bool readStringList(std::vector<std::string>& out);

    [[nodiscard]] bool atEnd() const noexcept { return pos_ == data_.size(); }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

private:
    [[nodiscard]] bool canRead(uint64_t n) const noexcept { return n <= remaining(); }

    std::span<const uint8_t> data_;
    std::size_t pos_ = 0;
};

} // namespace gnb::protocol
