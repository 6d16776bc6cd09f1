#pragma once

/// @file auth_types.hpp
/// @brief Core type definitions for the authentication service.
///
/// Credentials, token claims, the token response envelope and the
/// immutable configuration shared by the issuer, validator and gateway.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tmauth::service {

// -- Constants ----------------------------------------------------------------

/// Per-user salt length in bytes.
inline constexpr std::size_t kSaltLength = 16;

/// The only signing algorithm tokens may declare.
inline constexpr std::string_view kSigningAlgorithm = "HS256";

/// Authorization scheme and token_type value.
inline constexpr std::string_view kBearerScheme = "Bearer";

/// The only accepted OAuth2 grant_type.
inline constexpr std::string_view kPasswordGrant = "password";

// -- Credentials --------------------------------------------------------------

/// Raw random salt bytes, appended to the password before hashing.
using Salt = std::vector<uint8_t>;

/// Stored credential. Created at registration and never modified.
struct Credential {
    uint64_t id = 0;
    std::string username;
    Salt salt;
    std::string passwordHash;  ///< PHC-format scrypt string.
    std::chrono::system_clock::time_point createdAt{};
};

/// Fields delivered by the transport for a registration.
struct RegistrationRequest {
    std::string username;
    std::string password;
};

/// Fields delivered by the transport for a password-grant token exchange.
struct TokenRequest {
    std::string grantType;
    std::string username;
    std::string password;
};

// -- Tokens -------------------------------------------------------------------

/// Typed claims carried in a bearer token.
///
/// Invariant: expiresAt == issuedAt + configured lifetime.
struct TokenClaims {
    std::string username;
    std::chrono::system_clock::time_point issuedAt{};
    std::chrono::system_clock::time_point expiresAt{};
    bool authorized = false;
};

/// Output of the token issuer.
struct IssuedToken {
    std::string token;
    TokenClaims claims;
};

/// OAuth2 token response envelope.
struct TokenResponse {
    std::string accessToken;
    std::string tokenType{kBearerScheme};
    std::chrono::seconds expiresIn{};
};

// -- Clock --------------------------------------------------------------------

/// Source of "now". Injected so expiry can be tested at exact boundaries.
using Clock = std::function<std::chrono::system_clock::time_point()>;

/// Clock backed by std::chrono::system_clock.
[[nodiscard]] inline Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

// -- Configuration ------------------------------------------------------------

/// scrypt cost parameters. N = 2^log2N.
struct ScryptParams {
    uint32_t log2N = 14;
    uint32_t r = 8;
    uint32_t p = 1;
};

/// Cost bounds enforced on configuration and on stored hashes.
inline constexpr uint32_t kMaxScryptLog2N = 20;
inline constexpr uint32_t kMaxScryptBlockFactor = 64;

/// Largest scrypt working set (128 * r * N bytes) accepted: 256 MiB.
inline constexpr uint64_t kMaxScryptMemoryBytes = uint64_t{256} << 20;

/// Working set of one scrypt computation, 128 * r * N bytes.
[[nodiscard]] constexpr uint64_t scryptMemoryBytes(const ScryptParams& params) noexcept {
    return uint64_t{128} * params.r * (uint64_t{1} << params.log2N);
}

/// True when every parameter is in range and the working set fits the cap.
[[nodiscard]] constexpr bool scryptParamsWithinLimits(const ScryptParams& params) noexcept {
    return params.log2N >= 1 && params.log2N <= kMaxScryptLog2N &&
           params.r >= 1 && params.r <= kMaxScryptBlockFactor &&
           params.p >= 1 && params.p <= kMaxScryptBlockFactor &&
           scryptMemoryBytes(params) <= kMaxScryptMemoryBytes;
}

/// Longest accepted token lifetime: ten years.
inline constexpr std::chrono::hours kMaxTokenLifetime{87600};

/// Process-wide auth configuration, built once at startup and read-only after.
struct AuthConfig {
    /// HMAC-SHA-256 signing key. Required; empty means "not configured".
    std::string signingSecret;

    /// Token lifetime. Required; must be positive.
    std::chrono::hours tokenLifetime{0};

    /// Password hashing cost.
    ScryptParams scrypt{};
};

}  // namespace tmauth::service
