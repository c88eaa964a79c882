#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "sre/foundation/rating_result.hpp"

namespace sre::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g., "elo.team.k_factor") and enumeration of nested tables.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls. Nested maps such as
/// `elo.player.k_factors` are reachable per leaf ("elo.player.k_factors.QB")
/// and their child names can be listed with childKeys().
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file.
    /// @return Success or ConfigLoadFailed error.
    RatingResult<void> load(const std::filesystem::path& path);

    /// Load configuration from a YAML document held in memory.
    RatingResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    RatingResult<T> get(std::string_view key) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Names of the direct children of @p prefix, sorted.
    /// For "elo.player.k_factors" this yields {"CB", "DL", ...}.
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

private:
    RatingResult<void> loadNode(const YAML::Node& root);

    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
RatingResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return RatingResult<T>::err(
            RatingError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return RatingResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return RatingResult<T>::err(
            RatingError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

} // namespace sre::foundation
