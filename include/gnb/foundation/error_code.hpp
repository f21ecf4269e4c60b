#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the notification bridge.

#include <cstdint>
#include <string_view>

namespace gnb::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    AlreadyExists = 0x0004,

    // Protocol (0x0100 - 0x01FF)
    InvalidMessage = 0x0101,
    MessageTooLarge = 0x0102,
    TruncatedMessage = 0x0103,
    TrailingBytes = 0x0104,
    UnknownVariant = 0x0105,
    VersionMismatch = 0x0106,
    ChannelClosed = 0x0107,
    ChannelIoError = 0x0108,
    ProtocolViolation = 0x0109,

    // D-Bus (0x0200 - 0x02FF)
    BusConnectionFailed = 0x0201,
    MethodCallFailed = 0x0202,
    InvalidReply = 0x0203,
    NameRequestFailed = 0x0204,
    ObjectRegistrationFailed = 0x0205,
    SignalEmitFailed = 0x0206,
    MatchFailed = 0x0207,

    // Validation of untrusted input (0x0300 - 0x03FF)
    InvalidActionName = 0x0301,
    InvalidCategory = 0x0302,
    InvalidImage = 0x0303,
    InvalidTimeout = 0x0304,
    OddActionList = 0x0305,
    UnknownNotificationId = 0x0306,
    InvalidHint = 0x0307,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Protocol";
        case 0x0200: return "DBus";
        case 0x0300: return "Validation";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace gnb::foundation
