#pragma once

/// @file bridge_result.hpp
/// @brief BridgeResult<T> type alias for bridge error handling.

#include "gnb/core/result.hpp"
#include "gnb/foundation/bridge_error.hpp"

namespace gnb::foundation {

/// Result type specialized with BridgeError.
///
/// Example:
/// @code
///   BridgeResult<uint32_t> parseTimeout(int32_t ms) {
///       if (ms < -1) {
///           return BridgeResult<uint32_t>::err(
///               BridgeError(ErrorCode::InvalidTimeout, "timeout below -1"));
///       }
///       return BridgeResult<uint32_t>::ok(static_cast<uint32_t>(ms));
///   }
/// @endcode
template <typename T>
using BridgeResult = gnb::Result<T, BridgeError>;

}  // namespace gnb::foundation
