#include "tmauth/foundation/config_manager.hpp"

#include "tmauth/foundation/service_logger.hpp"

#include <cstdlib>
#include <string>

namespace tmauth::foundation {

ServiceResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed,
                         "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed,
                         std::string("YAML parse error: ") + e.what()));
    }

    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
    return ServiceResult<void>::ok();
}

ServiceResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed,
                         std::string("YAML parse error: ") + e.what()));
    }

    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
    return ServiceResult<void>::ok();
}

bool ConfigManager::overrideFromEnv(std::string_view key, const char* envVar) {
    const char* raw = std::getenv(envVar);
    if (raw == nullptr) {
        return false;
    }
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(std::string(raw));
    }
    TMAUTH_LOG_DEBUG(LogCategory::Config,
                     std::string("config key ") + std::string(key) + " set from " + envVar);
    return true;
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto child = it->first.as<std::string>();
            flatten(prefix.empty() ? child : prefix + "." + child, it->second);
        }
        return;
    }
    if (!prefix.empty()) {
        entries_[prefix] = YAML::Clone(node);
    }
}

} // namespace tmauth::foundation
