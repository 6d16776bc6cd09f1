#pragma once

/// @file token_issuer.hpp
/// @brief Issues HS256-signed bearer tokens.
///
/// Token format (RFC 7519):
///   base64url(header) . base64url(payload) . base64url(signature)
///
/// Header:  {"alg":"HS256","typ":"JWT"}
/// Payload: {"authorized":true,"exp":N,"iat":N,"username":"..."}

#include "tmauth/foundation/service_result.hpp"
#include "tmauth/service/auth_types.hpp"

#include <string>
#include <string_view>

namespace tmauth::service {

/// Builds and signs tokens for already-authenticated subjects.
///
/// Pure computation: no storage access, no shared mutable state.
class TokenIssuer {
public:
    explicit TokenIssuer(const AuthConfig& config, Clock clock = systemClock());

    /// Sign a token for @p subject valid for the configured lifetime.
    ///
    /// Fails with InvalidArgument for an empty subject, ConfigKeyNotFound
    /// when no signing secret is configured and ConfigTypeMismatch when
    /// the lifetime is not positive.
    [[nodiscard]] foundation::ServiceResult<IssuedToken> issueToken(
        std::string_view subject) const;

    /// OAuth2 envelope for an issued token: token_type "Bearer",
    /// expires_in = exp - iat.
    [[nodiscard]] static TokenResponse toResponse(const IssuedToken& issued);

private:
    std::string secret_;
    std::chrono::hours lifetime_;
    Clock clock_;
};

}  // namespace tmauth::service
