#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define GNB_VERSION_MAJOR 0
#define GNB_VERSION_MINOR 1
#define GNB_VERSION_PATCH 0
#define GNB_VERSION_STRING "0.1.0"

namespace gnb {

/// Project version information at compile time.
///
/// This is the release version of the executables; the wire protocol
/// carries its own version (see gnb/protocol/messages.hpp).
struct Version {
    static constexpr int major = GNB_VERSION_MAJOR;
    static constexpr int minor = GNB_VERSION_MINOR;
    static constexpr int patch = GNB_VERSION_PATCH;
    static constexpr const char* string = GNB_VERSION_STRING;
};

} // namespace gnb
