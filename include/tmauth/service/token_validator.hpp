#pragma once

/// @file token_validator.hpp
/// @brief Stateless bearer-token validation.

#include "tmauth/foundation/service_result.hpp"
#include "tmauth/service/auth_types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tmauth::service {

/// Verifies bearer tokens produced by TokenIssuer.
///
/// Validation is recomputed from the signature and embedded expiry on
/// every call; nothing is cached and nothing is mutated.
///
/// Failure codes (all in the Auth range, i.e. unauthenticated):
///   - TokenMissing:         no Authorization header
///   - MalformedAuthHeader:  not exactly "Bearer <token>"
///   - InvalidToken:         wrong segment count, bad encoding, bad JSON
///   - UnsupportedAlgorithm: header alg is anything but HS256 (incl. "none")
///   - InvalidSignature:     HMAC does not match
///   - TokenExpired:         now > exp
///   - InvalidClaims:        missing/ill-typed exp, iat, authorized or username
class TokenValidator {
public:
    explicit TokenValidator(const AuthConfig& config, Clock clock = systemClock());

    /// Validate a raw Authorization header value and return the username.
    /// An absent or empty header is TokenMissing.
    [[nodiscard]] foundation::ServiceResult<std::string> validateToken(
        std::optional<std::string_view> authorizationHeader) const;

    /// Verify a bare token (no scheme) and return its typed claims.
    [[nodiscard]] foundation::ServiceResult<TokenClaims> decode(std::string_view token) const;

    /// Split "Bearer <token>" and return the token part.
    [[nodiscard]] static foundation::ServiceResult<std::string_view> extractBearer(
        std::optional<std::string_view> authorizationHeader);

private:
    std::string secret_;
    Clock clock_;
};

}  // namespace tmauth::service
