/// @file token_validator.cpp
/// @brief TokenValidator implementation.
///
/// Order of checks: scheme, segment count, header alg, signature, payload
/// claims, expiry. The algorithm is pinned before the signature is looked
/// at, so a token declaring "none" or RS256 never reaches verification.

#include "tmauth/service/token_validator.hpp"

#include "tmauth/foundation/service_logger.hpp"

#include "crypto_utils.hpp"
#include "json_utils.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace tmauth::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

/// Split on every occurrence of @p delim (empty parts are kept).
std::vector<std::string_view> splitAll(std::string_view s, char delim) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

/// Numeric date claim as whole epoch seconds. Fractions and exponents are rejected.
std::optional<int64_t> numericDate(const detail::JsonObject& obj, std::string_view key) {
    if (const auto* i = detail::jsonField<int64_t>(obj, key)) {
        return *i;
    }
    return std::nullopt;
}

template <typename T>
ServiceResult<T> reject(ErrorCode code, std::string message) {
    TMAUTH_LOG_DEBUG(LogCategory::Auth, "token rejected: " + message);
    return ServiceResult<T>::err(ServiceError(code, std::move(message)));
}

} // namespace

TokenValidator::TokenValidator(const AuthConfig& config, Clock clock)
    : secret_(config.signingSecret), clock_(std::move(clock)) {}

ServiceResult<std::string_view> TokenValidator::extractBearer(
    std::optional<std::string_view> authorizationHeader) {
    if (!authorizationHeader || authorizationHeader->empty()) {
        return reject<std::string_view>(ErrorCode::TokenMissing, "token not set");
    }
    auto parts = splitAll(*authorizationHeader, ' ');
    if (parts.size() != 2 || parts[0] != kBearerScheme || parts[1].empty()) {
        return reject<std::string_view>(ErrorCode::MalformedAuthHeader,
                                        "malformed authorization header");
    }
    return ServiceResult<std::string_view>::ok(parts[1]);
}

ServiceResult<std::string> TokenValidator::validateToken(
    std::optional<std::string_view> authorizationHeader) const {
    auto bearer = extractBearer(authorizationHeader);
    if (!bearer) {
        return ServiceResult<std::string>::err(bearer.error());
    }
    auto claims = decode(bearer.value());
    if (!claims) {
        return ServiceResult<std::string>::err(claims.error());
    }
    return ServiceResult<std::string>::ok(std::move(claims).value().username);
}

ServiceResult<TokenClaims> TokenValidator::decode(std::string_view token) const {
    if (secret_.empty()) {
        return ServiceResult<TokenClaims>::err(
            ServiceError(ErrorCode::ConfigKeyNotFound, "signing secret is not configured"));
    }

    auto segments = splitAll(token, '.');
    if (segments.size() != 3) {
        return reject<TokenClaims>(ErrorCode::InvalidToken,
                                   "token contains an invalid number of segments");
    }

    // -- Header: pin the algorithm ---------------------------------------------
    auto headerJson = detail::base64urlDecodeString(segments[0]);
    if (!headerJson) {
        return reject<TokenClaims>(ErrorCode::InvalidToken, "token header is not base64url");
    }
    auto header = detail::parseFlatJsonObject(*headerJson);
    if (!header) {
        return reject<TokenClaims>(ErrorCode::InvalidToken, "token header is not valid JSON");
    }
    const auto* alg = detail::jsonField<std::string>(*header, "alg");
    if (alg == nullptr) {
        return reject<TokenClaims>(ErrorCode::InvalidToken, "token header has no alg");
    }
    if (*alg != kSigningAlgorithm) {
        return reject<TokenClaims>(ErrorCode::UnsupportedAlgorithm,
                                   "unexpected signing method: " + *alg);
    }

    // -- Signature ---------------------------------------------------------------
    std::string signingInput(segments[0]);
    signingInput += '.';
    signingInput += segments[1];

    auto mac = detail::hmacSha256(secret_, signingInput);
    if (!mac) {
        return ServiceResult<TokenClaims>::err(mac.error());
    }
    auto expected = detail::base64urlEncode(mac.value().data(), mac.value().size());
    if (!detail::constantTimeEqual(expected, segments[2])) {
        return reject<TokenClaims>(ErrorCode::InvalidSignature, "signature is invalid");
    }

    // -- Claims ------------------------------------------------------------------
    auto payloadJson = detail::base64urlDecodeString(segments[1]);
    if (!payloadJson) {
        return reject<TokenClaims>(ErrorCode::InvalidToken, "token payload is not base64url");
    }
    auto payload = detail::parseFlatJsonObject(*payloadJson);
    if (!payload) {
        return reject<TokenClaims>(ErrorCode::InvalidToken, "token payload is not valid JSON");
    }

    auto exp = numericDate(*payload, "exp");
    auto iat = numericDate(*payload, "iat");
    if (!exp || !iat) {
        return reject<TokenClaims>(ErrorCode::InvalidClaims, "token is missing exp or iat");
    }

    auto now = std::chrono::duration_cast<std::chrono::seconds>(
                   clock_().time_since_epoch()).count();
    if (now > *exp) {
        return reject<TokenClaims>(ErrorCode::TokenExpired, "token is expired");
    }
    if (now < *iat) {
        return reject<TokenClaims>(ErrorCode::InvalidClaims, "token used before issued");
    }

    const auto* authorized = detail::jsonField<bool>(*payload, "authorized");
    if (authorized == nullptr || !*authorized) {
        return reject<TokenClaims>(ErrorCode::InvalidClaims, "token is not authorized");
    }

    const auto* username = detail::jsonField<std::string>(*payload, "username");
    if (username == nullptr || username->empty()) {
        return reject<TokenClaims>(ErrorCode::InvalidClaims, "invalid token");
    }

    TokenClaims claims;
    claims.username = *username;
    claims.issuedAt = std::chrono::system_clock::time_point(std::chrono::seconds(*iat));
    claims.expiresAt = std::chrono::system_clock::time_point(std::chrono::seconds(*exp));
    claims.authorized = true;
    return ServiceResult<TokenClaims>::ok(std::move(claims));
}

}  // namespace tmauth::service
