/// @file hint_parser.cpp
/// @brief buildNotification() implementation.

#include "gnb/service/hint_parser.hpp"

#include <string>
#include <string_view>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/sanitize/notification_validator.hpp"

namespace gnb::service {

using foundation::BridgeError;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

BridgeResult<protocol::Notification> invalid(ErrorCode code, std::string message) {
    GNB_LOG_WARN(LogCategory::Guest, message);
    return BridgeResult<protocol::Notification>::err(BridgeError(code, std::move(message)));
}

std::string_view hintTypeName(const HintValue& value) {
    switch (value.index()) {
        case 0: return "b";
        case 1: return "y";
        case 2: return "i";
        case 3: return "u";
        case 4: return "s";
        case 5: return "(iiibiiay)";
        default: return std::get<UnsupportedHint>(value).signature;
    }
}

/// Boolean hint: a value of the wrong type is ignored.
void applyFlag(bool& flag, const std::string& key, const HintValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        flag = *b;
        return;
    }
    GNB_LOG_INFO(LogCategory::Guest,
                 "ignoring hint " + key + " of type " + std::string(hintTypeName(value)));
}

} // namespace

BridgeResult<protocol::Notification> buildNotification(NotifyRequest request) {
    protocol::Notification n;

    for (auto& [key, value] : request.hints) {
        if (key == "category") {
            auto* category = std::get_if<std::string>(&value);
            if (category == nullptr) {
                return invalid(ErrorCode::InvalidHint,
                               "category hint must be a string, got " +
                                   std::string(hintTypeName(value)));
            }
            n.category = std::move(*category);
        } else if (key == "image-data") {
            auto* image = std::get_if<protocol::ImageParameters>(&value);
            if (image == nullptr) {
                return invalid(ErrorCode::InvalidHint,
                               "image-data hint must be (iiibiiay), got " +
                                   std::string(hintTypeName(value)));
            }
            n.image = std::move(*image);
        } else if (key == "urgency") {
            const auto* urgency = std::get_if<uint8_t>(&value);
            if (urgency != nullptr && *urgency <= 2) {
                n.urgency = static_cast<protocol::Urgency>(*urgency);
            } else {
                GNB_LOG_INFO(LogCategory::Guest, "ignoring unknown urgency value");
            }
        } else if (key == "suppress-sound") {
            applyFlag(n.suppressSound, key, value);
        } else if (key == "transient") {
            applyFlag(n.transient, key, value);
        } else if (key == "resident") {
            applyFlag(n.resident, key, value);
        } else if (key == "action-icons" || key == "desktop-entry") {
            // Cannot be trusted across the domain boundary.
        } else if (key == "image_data" || key == "icon_data" || key == "image_path") {
            GNB_LOG_DEBUG(LogCategory::Guest, "ignoring deprecated hint " + key);
        } else if (key == "image-path") {
            GNB_LOG_INFO(LogCategory::Guest, "image paths are not supported");
        } else if (key == "sound-file" || key == "sound-name") {
            GNB_LOG_INFO(LogCategory::Guest, "sound hints are not supported");
        } else if (key == "x" || key == "y") {
            GNB_LOG_DEBUG(LogCategory::Guest, "ignoring coordinate hint " + key);
        } else {
            GNB_LOG_INFO(LogCategory::Guest, "unknown hint " + key + ", ignoring");
        }
    }

    if (request.actions.size() % 2 != 0) {
        return invalid(ErrorCode::OddActionList, "actions array has odd length");
    }
    for (std::size_t i = 0; i < request.actions.size(); i += 2) {
        auto checked = sanitize::checkActionName(request.actions[i]);
        if (checked.hasError()) {
            return invalid(ErrorCode::InvalidActionName,
                           std::string(checked.error().message()));
        }
    }

    n.replacesId = request.replacesId;
    n.summary = std::move(request.summary);
    n.body = std::move(request.body);
    n.actions = std::move(request.actions);
    n.expireTimeout = request.expireTimeout;
    return BridgeResult<protocol::Notification>::ok(std::move(n));
}

} // namespace gnb::service
