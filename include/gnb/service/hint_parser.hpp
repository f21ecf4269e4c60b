#pragma once

/// @file hint_parser.hpp
/// @brief Translation of a guest Notify call into a wire Notification.

#include "gnb/foundation/bridge_result.hpp"
#include "gnb/protocol/messages.hpp"
#include "gnb/service/guest_types.hpp"

namespace gnb::service {

using foundation::BridgeResult;

/// Build the Notification forwarded to the host.
///
/// The application name and icon are dropped. Recognized hints are
/// "category" (string), "image-data" ((iiibiiay)), "urgency" (byte 0-2),
/// "suppress-sound", "transient" and "resident" (booleans). Everything
/// else is logged and ignored.
///
/// Fails with InvalidHint if "category" or "image-data" has the wrong
/// type, OddActionList for an odd actions array, and InvalidActionName
/// for a malformed action key. The host re-validates everything.
BridgeResult<protocol::Notification> buildNotification(NotifyRequest request);

} // namespace gnb::service
