/// @file wire_codec.cpp
/// @brief WireWriter / WireReader implementation.

#include "gnb/protocol/wire_codec.hpp"

namespace gnb::protocol {

// ---------------------------------------------------------------------------
// WireWriter
// ---------------------------------------------------------------------------

void WireWriter::writeU8(uint8_t value) {
    buf_.push_back(value);
}

void WireWriter::writeBool(bool value) {
    buf_.push_back(value ? 1 : 0);
}

void WireWriter::writeU32(uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        buf_.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void WireWriter::writeI32(int32_t value) {
    writeU32(static_cast<uint32_t>(value));
}

void WireWriter::writeU64(uint64_t value) {
    for (int shift = 0; shift < 64; shift += 8) {
        buf_.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void WireWriter::writeString(const std::string& value) {
    writeU64(value.size());
    buf_.insert(buf_.end(), value.begin(), value.end());
}

void WireWriter::writeBytes(std::span<const uint8_t> value) {
    writeU64(value.size());
    buf_.insert(buf_.end(), value.begin(), value.end());
}

void WireWriter::writeStringList(const std::vector<std::string>& values) {
    writeU64(values.size());
    for (const auto& s : values) {
        writeString(s);
    }
}

// ---------------------------------------------------------------------------
// WireReader
// ---------------------------------------------------------------------------

bool WireReader::readU8(uint8_t& out) {
    if (!canRead(1)) return false;
    out = data_[pos_++];
    return true;
}

bool WireReader::readBool(bool& out) {
    uint8_t raw = 0;
    if (!readU8(raw)) return false;
    if (raw > 1) return false;
    out = (raw == 1);
    return true;
}

bool WireReader::readU32(uint32_t& out) {
    if (!canRead(4)) return false;
    out = 0;
    for (int i = 0; i < 4; ++i) {
        out |= static_cast<uint32_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += 4;
    return true;
}

bool WireReader::readI32(int32_t& out) {
    uint32_t raw = 0;
    if (!readU32(raw)) return false;
    out = static_cast<int32_t>(raw);
    return true;
}

bool WireReader::readU64(uint64_t& out) {
    if (!canRead(8)) return false;
    out = 0;
    for (int i = 0; i < 8; ++i) {
        out |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += 8;
    return true;
}

bool WireReader::readString(std::string& out) {
    uint64_t len = 0;
    if (!readU64(len)) return false;
    if (!canRead(len)) return false;
    out.assign(reinterpret_cast<const char*>(data_.data() + pos_),
               static_cast<std::size_t>(len));
    pos_ += static_cast<std::size_t>(len);
    return true;
}

bool WireReader::readBytes(std::vector<uint8_t>& out) {
    uint64_t len = 0;
    if (!readU64(len)) return false;
    if (!canRead(len)) return false;
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(pos_);
    out.assign(first, first + static_cast<std::ptrdiff_t>(len));
    pos_ += static_cast<std::size_t>(len);
    return true;
}

bool WireReader::readStringList(std::vector<std::string>& out) {
    uint64_t count = 0;
    if (!readU64(count)) return false;
    // Each element needs at least its 8-byte length prefix.
    if (count > remaining() / 8) return false;
    out.clear();
    out.reserve(static_cast<std::size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        std::string s;
        if (!readString(s)) return false;
        out.push_back(std::move(s));
    }
    return true;
}

} // namespace gnb::protocol
