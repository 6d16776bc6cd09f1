#pragma once

/// @file auth_config.hpp
/// @brief Builds the immutable AuthConfig from a ConfigManager.

#include "tmauth/foundation/config_manager.hpp"
#include "tmauth/foundation/service_result.hpp"
#include "tmauth/service/auth_types.hpp"

#include <chrono>
#include <string_view>

namespace tmauth::service {

/// Environment variables consulted by applyEnvironmentOverrides().
inline constexpr const char* kSigningSecretEnv = "TMAUTH_SIGNING_SECRET";
inline constexpr const char* kTokenLifetimeEnv = "TMAUTH_TOKEN_LIFETIME_HOURS";
inline constexpr const char* kHttpPortEnv = "TMAUTH_HTTP_PORT";

/// Parse a token lifetime in whole hours ("24").
/// ConfigTypeMismatch for anything but a decimal integer in
/// [1, kMaxTokenLifetime].
[[nodiscard]] foundation::ServiceResult<std::chrono::hours> parseLifetimeHours(
    std::string_view text);

/// Copy TMAUTH_SIGNING_SECRET, TMAUTH_TOKEN_LIFETIME_HOURS and
/// TMAUTH_HTTP_PORT over their config keys when set.
void applyEnvironmentOverrides(foundation::ConfigManager& config);

/// Read auth.signing_secret, auth.token_lifetime_hours and the optional
/// auth.scrypt.* cost parameters.
///
/// ConfigKeyNotFound when the secret or lifetime is missing (an empty
/// secret counts as missing); ConfigTypeMismatch when a value is
/// ill-typed or out of range, including scrypt costs whose working set
/// exceeds kMaxScryptMemoryBytes.
[[nodiscard]] foundation::ServiceResult<AuthConfig> loadAuthConfig(
    const foundation::ConfigManager& config);

}  // namespace tmauth::service
