#include "sre/foundation/config_manager.hpp"

#include <algorithm>

namespace sre::foundation {

RatingResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return loadNode(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::ConfigLoadFailed,
                        "failed to open config file: " + path.string(), path.string()));
    } catch (const YAML::ParserException& e) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::ConfigLoadFailed,
                        std::string("YAML parse error: ") + e.what(), path.string()));
    }
}

RatingResult<void> ConfigManager::loadString(std::string_view yaml) {
    try {
        return loadNode(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

RatingResult<void> ConfigManager::loadNode(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsDefined() && !root.IsNull()) {
        flatten("", root);
    }
    return RatingResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::lock_guard lock(mutex_);
    std::string head = std::string(prefix) + ".";
    std::vector<std::string> children;
    for (const auto& [key, node] : entries_) {
        if (!key.starts_with(head)) {
            continue;
        }
        auto rest = key.substr(head.size());
        auto child = rest.substr(0, rest.find('.'));
        if (std::find(children.begin(), children.end(), child) == children.end()) {
            children.push_back(std::move(child));
        }
    }
    std::sort(children.begin(), children.end());
    return children;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null): store with its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace sre::foundation
