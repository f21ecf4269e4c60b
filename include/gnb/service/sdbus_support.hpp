#pragma once

/// @file sdbus_support.hpp
/// @brief RAII handles and error conversion for sd-bus.

#include <memory>
#include <string_view>

#include <systemd/sd-bus.h>

#include "gnb/foundation/bridge_error.hpp"

namespace gnb::service {

inline constexpr const char* kNotificationsName = "org.freedesktop.Notifications";
inline constexpr const char* kNotificationsPath = "/org/freedesktop/Notifications";
inline constexpr const char* kNotificationsInterface = "org.freedesktop.Notifications";

struct SdBusDeleter {
    void operator()(sd_bus* bus) const noexcept { sd_bus_flush_close_unref(bus); }
};

struct SdBusMessageDeleter {
    void operator()(sd_bus_message* m) const noexcept { sd_bus_message_unref(m); }
};

struct SdBusSlotDeleter {
    void operator()(sd_bus_slot* slot) const noexcept { sd_bus_slot_unref(slot); }
};

using SdBusPtr = std::unique_ptr<sd_bus, SdBusDeleter>;
using SdBusMessagePtr = std::unique_ptr<sd_bus_message, SdBusMessageDeleter>;
using SdBusSlotPtr = std::unique_ptr<sd_bus_slot, SdBusSlotDeleter>;

/// sd_bus_error that frees itself.
class ScopedBusError {
public:
    ScopedBusError() = default;
    ~ScopedBusError() { sd_bus_error_free(&error_); }

    ScopedBusError(const ScopedBusError&) = delete;
    ScopedBusError& operator=(const ScopedBusError&) = delete;

    sd_bus_error* get() noexcept { return &error_; }
    [[nodiscard]] bool isSet() const noexcept { return sd_bus_error_is_set(&error_) != 0; }

private:
    sd_bus_error error_ = SD_BUS_ERROR_NULL;
};

/// Build a BridgeError from an sd-bus return code.
///
/// If @p reply carries a D-Bus error, its name is attached as
/// DBusErrorInfo context and its message becomes the error message.
foundation::BridgeError busError(foundation::ErrorCode code, std::string_view what,
                                 int r, const sd_bus_error* reply = nullptr);

} // namespace gnb::service
