/// @file capabilities.cpp
/// @brief Capability name table and parsing.

#include "gnb/service/capabilities.hpp"

#include <array>
#include <utility>

#include "gnb/foundation/bridge_logger.hpp"

namespace gnb::service {

using foundation::LogCategory;

namespace {

constexpr std::array<std::pair<Capability, std::string_view>, 11> kCapabilityNames = {{
    {Capability::Body, "body"},
    {Capability::BodyHyperlinks, "body-hyperlinks"},
    {Capability::BodyMarkup, "body-markup"},
    {Capability::Persistence, "persistence"},
    {Capability::Sound, "sound"},
    {Capability::BodyImages, "body-images"},
    {Capability::IconMulti, "icon-multi"},
    {Capability::IconStatic, "icon-static"},
    {Capability::Actions, "actions"},
    {Capability::ActionIcons, "action-icons"},
    {Capability::InlineReply, "inline-reply"},
}};

} // namespace

std::optional<Capability> capabilityFromName(std::string_view name) noexcept {
    for (const auto& [cap, capName] : kCapabilityNames) {
        if (capName == name) {
            return cap;
        }
    }
    return std::nullopt;
}

std::string_view capabilityName(Capability cap) noexcept {
    for (const auto& [c, capName] : kCapabilityNames) {
        if (c == cap) {
            return capName;
        }
    }
    return "unknown";
}

Capabilities Capabilities::parse(const std::vector<std::string>& names) {
    Capabilities caps;
    for (const auto& name : names) {
        if (auto cap = capabilityFromName(name)) {
            caps.add(*cap);
        } else {
            GNB_LOG_INFO(LogCategory::Host, "unknown capability " + name + " detected");
        }
    }
    return caps;
}

std::vector<std::string> Capabilities::names() const {
    std::vector<std::string> out;
    for (const auto& [cap, capName] : kCapabilityNames) {
        if (has(cap)) {
            out.emplace_back(capName);
        }
    }
    return out;
}

} // namespace gnb::service
