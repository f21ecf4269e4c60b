/// @file sdbus_marshal.cpp
/// @brief Notify argument encoding and decoding.

#include "gnb/service/sdbus_marshal.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <utility>

namespace gnb::service {

namespace {

// -- Hint encoding -----------------------------------------------------------
// Each hint is one "{sv}" dict entry.

int openHint(sd_bus_message* m, const char* key, const char* signature) {
    int r = sd_bus_message_open_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0) return r;
    r = sd_bus_message_append(m, "s", key);
    if (r < 0) return r;
    return sd_bus_message_open_container(m, SD_BUS_TYPE_VARIANT, signature);
}

int closeHint(sd_bus_message* m) {
    int r = sd_bus_message_close_container(m);  // variant
    if (r < 0) return r;
    return sd_bus_message_close_container(m);   // dict entry
}

int appendBoolHint(sd_bus_message* m, const char* key) {
    int r = openHint(m, key, "b");
    if (r < 0) return r;
    r = sd_bus_message_append(m, "b", 1);
    if (r < 0) return r;
    return closeHint(m);
}

// -- Hint decoding -----------------------------------------------------------

int readImage(sd_bus_message* m, protocol::ImageParameters& image) {
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "(iiibiiay)");
    if (r < 0) return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_STRUCT, "iiibiiay");
    if (r < 0) return r;

    int hasAlpha = 0;
    r = sd_bus_message_read(m, "iiibii", &image.untrustedWidth, &image.untrustedHeight,
                            &image.untrustedRowstride, &hasAlpha,
                            &image.untrustedBitsPerSample, &image.untrustedChannels);
    if (r < 0) return r;
    image.untrustedHasAlpha = hasAlpha != 0;

    const void* data = nullptr;
    size_t size = 0;
    r = sd_bus_message_read_array(m, 'y', &data, &size);
    if (r < 0) return r;
    const auto* bytes = static_cast<const uint8_t*>(data);
    image.untrustedData.assign(bytes, bytes + size);

    r = sd_bus_message_exit_container(m);  // struct
    if (r < 0) return r;
    return sd_bus_message_exit_container(m);  // variant
}

/// Read the variant value of one "{sv}" entry.
int readHintValue(sd_bus_message* m, HintValue& value) {
    char type = 0;
    const char* contents = nullptr;
    int r = sd_bus_message_peek_type(m, &type, &contents);
    if (r < 0) return r;
    std::string signature = contents != nullptr ? contents : "";

    if (signature == "b") {
        int v = 0;
        r = sd_bus_message_read(m, "v", "b", &v);
        value = (v != 0);
    } else if (signature == "y") {
        uint8_t v = 0;
        r = sd_bus_message_read(m, "v", "y", &v);
        value = v;
    } else if (signature == "i") {
        int32_t v = 0;
        r = sd_bus_message_read(m, "v", "i", &v);
        value = v;
    } else if (signature == "u") {
        uint32_t v = 0;
        r = sd_bus_message_read(m, "v", "u", &v);
        value = v;
    } else if (signature == "s") {
        const char* v = nullptr;
        r = sd_bus_message_read(m, "v", "s", &v);
        if (r >= 0) value = std::string(v);
    } else if (signature == "(iiibiiay)") {
        protocol::ImageParameters image;
        r = readImage(m, image);
        if (r >= 0) value = std::move(image);
    } else {
        r = sd_bus_message_skip(m, "v");
        value = UnsupportedHint{std::move(signature)};
    }
    return r;
}

} // namespace

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

int appendActions(sd_bus_message* m, const std::vector<std::string>& actions) {
    int r = sd_bus_message_open_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0) return r;
    for (const auto& a : actions) {
        r = sd_bus_message_append(m, "s", a.c_str());
        if (r < 0) return r;
    }
    return sd_bus_message_close_container(m);
}

int appendHints(sd_bus_message* m, const NotifyHints& hints) {
    int r = sd_bus_message_open_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0) return r;

    if (hints.urgency) {
        r = openHint(m, "urgency", "y");
        if (r < 0) return r;
        r = sd_bus_message_append(m, "y", *hints.urgency);
        if (r < 0) return r;
        r = closeHint(m);
        if (r < 0) return r;
    }
    if (hints.resident && (r = appendBoolHint(m, "resident")) < 0) return r;
    if (hints.suppressSound && (r = appendBoolHint(m, "suppress-sound")) < 0) return r;
    if (hints.transient && (r = appendBoolHint(m, "transient")) < 0) return r;

    if (hints.category) {
        r = openHint(m, "category", "s");
        if (r < 0) return r;
        r = sd_bus_message_append(m, "s", hints.category->c_str());
        if (r < 0) return r;
        r = closeHint(m);
        if (r < 0) return r;
    }

    if (hints.image) {
        const auto& img = *hints.image;
        r = openHint(m, "image-data", "(iiibiiay)");
        if (r < 0) return r;
        r = sd_bus_message_open_container(m, SD_BUS_TYPE_STRUCT, "iiibiiay");
        if (r < 0) return r;
        r = sd_bus_message_append(m, "iiibii", img.width, img.height, img.rowstride,
                                  img.hasAlpha ? 1 : 0, img.bitsPerSample, img.channels);
        if (r < 0) return r;
        r = sd_bus_message_append_array(m, 'y', img.data.data(), img.data.size());
        if (r < 0) return r;
        r = sd_bus_message_close_container(m);  // struct
        if (r < 0) return r;
        r = closeHint(m);
        if (r < 0) return r;
    }

    return sd_bus_message_close_container(m);
}

int appendNotifyCall(sd_bus_message* m, const NotifyCall& call) {
    int r = sd_bus_message_append(m, "susss", call.appName.c_str(), call.replacesId,
                                  call.appIcon.c_str(), call.summary.c_str(),
                                  call.body.c_str());
    if (r < 0) return r;
    r = appendActions(m, call.actions);
    if (r < 0) return r;
    r = appendHints(m, call.hints);
    if (r < 0) return r;
    return sd_bus_message_append(m, "i", call.expireTimeout);
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

int readStrv(sd_bus_message* m, std::vector<std::string>& out) {
    char** strv = nullptr;
    int r = sd_bus_message_read_strv(m, &strv);
    if (r < 0) return r;
    if (r == 0) return -ENXIO;  // end of message
    for (char** it = strv; it != nullptr && *it != nullptr; ++it) {
        out.emplace_back(*it);
        std::free(*it);
    }
    std::free(strv);
    return 1;
}

int readHints(sd_bus_message* m, HintMap& hints) {
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0) return r;
    if (r == 0) return -ENXIO;  // end of message
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
        const char* key = nullptr;
        r = sd_bus_message_read(m, "s", &key);
        if (r < 0) return r;
        HintValue value;
        r = readHintValue(m, value);
        if (r < 0) return r;
        hints.insert_or_assign(std::string(key), std::move(value));
        r = sd_bus_message_exit_container(m);
        if (r < 0) return r;
    }
    if (r < 0) return r;
    return sd_bus_message_exit_container(m);
}

int readNotifyRequest(sd_bus_message* m, NotifyRequest& req) {
    const char* appName = nullptr;
    const char* appIcon = nullptr;
    const char* summary = nullptr;
    const char* body = nullptr;
    int r = sd_bus_message_read(m, "susss", &appName, &req.replacesId, &appIcon,
                                &summary, &body);
    if (r < 0) return r;
    req.appName = appName;
    req.appIcon = appIcon;
    req.summary = summary;
    req.body = body;

    r = readStrv(m, req.actions);
    if (r < 0) return r;
    r = readHints(m, req.hints);
    if (r < 0) return r;
    return sd_bus_message_read(m, "i", &req.expireTimeout);
}

} // namespace gnb::service
