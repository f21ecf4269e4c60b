#pragma once

/// @file sdbus_marshal.hpp
/// @brief Notify arguments to and from sd-bus messages.
///
/// All functions follow the sd-bus convention: a negative errno on
/// failure, non-negative on success. The message cursor is left after the
/// last value handled.

#include <string>
#include <vector>

#include <systemd/sd-bus.h>

#include "gnb/service/guest_types.hpp"
#include "gnb/service/notification_backend.hpp"

namespace gnb::service {

// ---------------------------------------------------------------------------
// Host side: building the call to the real notification server
// ---------------------------------------------------------------------------

/// Append an "as" array.
int appendActions(sd_bus_message* m, const std::vector<std::string>& actions);

/// Append the "a{sv}" hints dictionary. Only set hints are written;
/// urgency goes out as a byte, image-data as "(iiibiiay)".
int appendHints(sd_bus_message* m, const NotifyHints& hints);

/// Append the complete "susssasa{sv}i" Notify argument list.
int appendNotifyCall(sd_bus_message* m, const NotifyCall& call);

// ---------------------------------------------------------------------------
// Guest side: decoding calls from local applications
// ---------------------------------------------------------------------------

/// Read an "as" array into @p out.
int readStrv(sd_bus_message* m, std::vector<std::string>& out);

/// Read an "a{sv}" dictionary. Values of undecoded types are skipped and
/// recorded as UnsupportedHint with their signature.
int readHints(sd_bus_message* m, HintMap& hints);

/// Read the complete "susssasa{sv}i" Notify argument list.
int readNotifyRequest(sd_bus_message* m, NotifyRequest& req);

} // namespace gnb::service
