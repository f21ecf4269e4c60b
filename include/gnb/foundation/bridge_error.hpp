#pragma once

/// @file bridge_error.hpp
/// @brief Error type used with Result<T, BridgeError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "gnb/foundation/error_code.hpp"

namespace gnb::foundation {

/// Context attached to errors that originate from a D-Bus method error
/// reply, so the error name can be carried across the bridge unchanged.
struct DBusErrorInfo {
    std::string name;
};

/// Well-known D-Bus error names used by the bridge.
namespace DBusErrorName {
    inline constexpr std::string_view Failed = "org.freedesktop.DBus.Error.Failed";
    inline constexpr std::string_view InvalidArgs = "org.freedesktop.DBus.Error.InvalidArgs";
} // namespace DBusErrorName

/// Error carrying a code, a human-readable message, and optional
/// type-erased context data.
class BridgeError {
public:
    BridgeError() = default;

    explicit BridgeError(ErrorCode code)
        : code_(code) {}

    BridgeError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    BridgeError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace gnb::foundation
