#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "gnb/foundation/bridge_result.hpp"

namespace gnb::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document and dotted-key
/// access (e.g., "host.summary_prefix"). The YAML tree is flattened into a
/// key-value map on load; sequences stay whole under their key so that
/// lists such as "guest.capabilities" can be read as std::vector.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    BridgeResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    BridgeResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    BridgeResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, falling back to @p fallback when the key is
    /// absent. A present key of the wrong type is still an error.
    template <typename T>
    BridgeResult<T> getOr(std::string_view key, T fallback) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
BridgeResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return BridgeResult<T>::err(
            BridgeError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return BridgeResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return BridgeResult<T>::err(
            BridgeError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
BridgeResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return BridgeResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

} // namespace gnb::foundation
