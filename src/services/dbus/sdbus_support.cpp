/// @file sdbus_support.cpp
/// @brief sd-bus error conversion.

#include "gnb/service/sdbus_support.hpp"

#include <cstring>
#include <string>
#include <utility>

namespace gnb::service {

using foundation::BridgeError;
using foundation::DBusErrorInfo;

BridgeError busError(foundation::ErrorCode code, std::string_view what, int r,
                     const sd_bus_error* reply) {
    if (reply != nullptr && sd_bus_error_is_set(reply)) {
        std::string message = reply->message != nullptr ? reply->message : std::string(what);
        return BridgeError(code, std::move(message), DBusErrorInfo{reply->name});
    }
    return BridgeError(code, std::string(what) + ": " + std::strerror(r < 0 ? -r : r));
}

} // namespace gnb::service
