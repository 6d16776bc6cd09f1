/// @file token_issuer.cpp
/// @brief TokenIssuer implementation.

#include "tmauth/service/token_issuer.hpp"

#include "tmauth/foundation/service_logger.hpp"

#include "crypto_utils.hpp"
#include "json_utils.hpp"

#include <chrono>
#include <string>

namespace tmauth::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

constexpr std::string_view kHeaderJson = R"({"alg":"HS256","typ":"JWT"})";

int64_t toEpoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

/// Keys in lexical order.
std::string payloadJson(const TokenClaims& claims) {
    std::string out = "{\"authorized\":";
    out += claims.authorized ? "true" : "false";
    out += ",\"exp\":" + std::to_string(toEpoch(claims.expiresAt));
    out += ",\"iat\":" + std::to_string(toEpoch(claims.issuedAt));
    out += ",\"username\":" + detail::jsonQuote(claims.username);
    out += '}';
    return out;
}

} // namespace

TokenIssuer::TokenIssuer(const AuthConfig& config, Clock clock)
    : secret_(config.signingSecret),
      lifetime_(config.tokenLifetime),
      clock_(std::move(clock)) {}

ServiceResult<IssuedToken> TokenIssuer::issueToken(std::string_view subject) const {
    if (subject.empty()) {
        return ServiceResult<IssuedToken>::err(
            ServiceError(ErrorCode::InvalidArgument, "token subject must not be empty"));
    }
    if (secret_.empty()) {
        return ServiceResult<IssuedToken>::err(
            ServiceError(ErrorCode::ConfigKeyNotFound, "signing secret is not configured"));
    }
    if (lifetime_.count() <= 0 || lifetime_ > kMaxTokenLifetime) {
        return ServiceResult<IssuedToken>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch, "token lifetime is out of range"));
    }

    // JWT timestamps have whole-second resolution.
    auto now = std::chrono::time_point_cast<std::chrono::seconds>(clock_());

    TokenClaims claims;
    claims.username = std::string(subject);
    claims.issuedAt = now;
    claims.expiresAt = now + lifetime_;
    claims.authorized = true;

    std::string signingInput = detail::base64urlEncode(kHeaderJson);
    signingInput += '.';
    signingInput += detail::base64urlEncode(payloadJson(claims));

    auto mac = detail::hmacSha256(secret_, signingInput);
    if (!mac) {
        TMAUTH_LOG_ERROR(LogCategory::Crypto, std::string(mac.error().message()));
        return ServiceResult<IssuedToken>::err(mac.error());
    }

    IssuedToken issued;
    issued.token = signingInput + "." +
                   detail::base64urlEncode(mac.value().data(), mac.value().size());
    issued.claims = std::move(claims);
    return ServiceResult<IssuedToken>::ok(std::move(issued));
}

TokenResponse TokenIssuer::toResponse(const IssuedToken& issued) {
    TokenResponse response;
    response.accessToken = issued.token;
    response.expiresIn = std::chrono::duration_cast<std::chrono::seconds>(
        issued.claims.expiresAt - issued.claims.issuedAt);
    return response;
}

}  // namespace tmauth::service
