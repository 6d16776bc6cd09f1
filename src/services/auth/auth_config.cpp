/// @file auth_config.cpp
/// @brief AuthConfig loading and validation.

#include "tmauth/service/auth_config.hpp"

#include "tmauth/foundation/error_code.hpp"
#include "tmauth/foundation/service_error.hpp"

#include <charconv>
#include <cstdint>
#include <string>

namespace tmauth::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

ServiceResult<uint32_t> readCost(const ConfigManager& config, std::string_view key,
                                 uint32_t fallback, uint32_t lo, uint32_t hi) {
    auto value = config.getOr<uint32_t>(key, fallback);
    if (!value) {
        return value;
    }
    if (value.value() < lo || value.value() > hi) {
        return ServiceResult<uint32_t>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch,
                         std::string(key) + " must be between " + std::to_string(lo) +
                             " and " + std::to_string(hi)));
    }
    return value;
}

} // namespace

ServiceResult<std::chrono::hours> parseLifetimeHours(std::string_view text) {
    int64_t hours = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, hours);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return ServiceResult<std::chrono::hours>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch,
                         "token lifetime is not an integer: \"" + std::string(text) + "\""));
    }
    if (hours <= 0) {
        return ServiceResult<std::chrono::hours>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch, "token lifetime must be positive"));
    }
    if (hours > kMaxTokenLifetime.count()) {
        return ServiceResult<std::chrono::hours>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch,
                         "token lifetime must not exceed " +
                             std::to_string(kMaxTokenLifetime.count()) + " hours"));
    }
    return ServiceResult<std::chrono::hours>::ok(std::chrono::hours(hours));
}

void applyEnvironmentOverrides(ConfigManager& config) {
    config.overrideFromEnv("auth.signing_secret", kSigningSecretEnv);
    config.overrideFromEnv("auth.token_lifetime_hours", kTokenLifetimeEnv);
    config.overrideFromEnv("http.port", kHttpPortEnv);
}

ServiceResult<AuthConfig> loadAuthConfig(const ConfigManager& config) {
    AuthConfig cfg;

    auto secret = config.get<std::string>("auth.signing_secret");
    if (!secret) {
        return ServiceResult<AuthConfig>::err(secret.error());
    }
    if (secret.value().empty()) {
        return ServiceResult<AuthConfig>::err(
            ServiceError(ErrorCode::ConfigKeyNotFound, "auth.signing_secret is empty"));
    }
    cfg.signingSecret = std::move(secret).value();

    // Scalars convert to string whether written as 24 or "24".
    auto lifetimeText = config.get<std::string>("auth.token_lifetime_hours");
    if (!lifetimeText) {
        return ServiceResult<AuthConfig>::err(lifetimeText.error());
    }
    auto lifetime = parseLifetimeHours(lifetimeText.value());
    if (!lifetime) {
        return ServiceResult<AuthConfig>::err(lifetime.error());
    }
    cfg.tokenLifetime = lifetime.value();

    auto log2N = readCost(config, "auth.scrypt.log2_n", cfg.scrypt.log2N, 1, kMaxScryptLog2N);
    if (!log2N) {
        return ServiceResult<AuthConfig>::err(log2N.error());
    }
    auto r = readCost(config, "auth.scrypt.r", cfg.scrypt.r, 1, kMaxScryptBlockFactor);
    if (!r) {
        return ServiceResult<AuthConfig>::err(r.error());
    }
    auto p = readCost(config, "auth.scrypt.p", cfg.scrypt.p, 1, kMaxScryptBlockFactor);
    if (!p) {
        return ServiceResult<AuthConfig>::err(p.error());
    }
    cfg.scrypt = ScryptParams{log2N.value(), r.value(), p.value()};
    if (!scryptParamsWithinLimits(cfg.scrypt)) {
        return ServiceResult<AuthConfig>::err(ServiceError(
            ErrorCode::ConfigTypeMismatch,
            "auth.scrypt needs " + std::to_string(scryptMemoryBytes(cfg.scrypt) >> 20) +
                " MiB per hash, limit is " + std::to_string(kMaxScryptMemoryBytes >> 20) +
                " MiB"));
    }

    return ServiceResult<AuthConfig>::ok(std::move(cfg));
}

}  // namespace tmauth::service
