#pragma once

/// @file config_manager.hpp
/// @brief YAML configuration with dotted-key typed access and environment overrides.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "tmauth/foundation/service_result.hpp"

namespace tmauth::foundation {

/// Flat view over a YAML document.
///
/// Nested maps are flattened into dotted keys ("auth.signing_secret") on
/// load, so lookups never walk yaml-cpp nodes by reference. Values read
/// from the environment are stored as YAML scalars and convert through
/// the same get<T>() path as file values.
///
/// @code
///   ConfigManager config;
///   config.load("/etc/tmauth/config.yaml");
///   config.overrideFromEnv("auth.signing_secret", "TMAUTH_SIGNING_SECRET");
///   auto port = config.get<int>("http.port");
/// @endcode
class ConfigManager {
public:
    ConfigManager() = default;

    /// Replace the current contents with the YAML file at @p path.
    ServiceResult<void> load(const std::filesystem::path& path);

    /// Replace the current contents with an in-memory YAML document.
    ServiceResult<void> loadFromString(std::string_view yaml);

    /// Typed lookup; ConfigKeyNotFound or ConfigTypeMismatch on failure.
    template <typename T>
    ServiceResult<T> get(std::string_view key) const;

    /// Typed lookup with a fallback for absent keys.
    /// A present key of the wrong type is still an error.
    template <typename T>
    ServiceResult<T> getOr(std::string_view key, T fallback) const;

    template <typename T>
    void set(std::string_view key, const T& value);

    /// Copy environment variable @p envVar over @p key if it is set.
    /// Returns true when an override was applied.
    bool overrideFromEnv(std::string_view key, const char* envVar);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
ServiceResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end() || it->second.IsNull()) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigKeyNotFound,
                         "config key not found: " + std::string(key)));
    }
    try {
        return ServiceResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch,
                         "type mismatch for key: " + std::string(key)));
    }
}

template <typename T>
ServiceResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return ServiceResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace tmauth::foundation
