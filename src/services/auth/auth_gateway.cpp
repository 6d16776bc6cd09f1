/// @file auth_gateway.cpp
/// @brief AuthGateway implementation.

#include "tmauth/service/auth_gateway.hpp"

#include "tmauth/foundation/error_code.hpp"
#include "tmauth/foundation/service_error.hpp"
#include "tmauth/foundation/service_logger.hpp"
#include "tmauth/service/credential_store.hpp"
#include "tmauth/service/form_codec.hpp"
#include "tmauth/service/password_hasher.hpp"
#include "tmauth/service/router.hpp"
#include "tmauth/service/token_issuer.hpp"
#include "tmauth/service/token_validator.hpp"

#include "json_utils.hpp"

#include <string>

namespace tmauth::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceError;
using foundation::ServiceLogger;
using foundation::ServiceResult;

namespace {

constexpr std::string_view kBadCredentials = "invalid username or password";

void logForUser(LogLevel level, std::string_view msg, std::string_view username) {
    auto& logger = ServiceLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Auth)) {
        return;
    }
    LogContext ctx;
    ctx.username = std::string(username);
    logger.logWithContext(level, LogCategory::Auth, msg, ctx);
}

std::string fieldOrEmpty(const FormFields& fields, const char* name) {
    auto it = fields.find(name);
    return it == fields.end() ? std::string{} : it->second;
}

std::string_view errorKind(ErrorCode code) {
    if (foundation::isUnauthenticated(code)) {
        return "unauthenticated";
    }
    switch (code) {
        case ErrorCode::InvalidArgument:
            return "bad_request";
        case ErrorCode::UnsupportedGrantType:
            return "unsupported_grant_type";
        case ErrorCode::DuplicateUsername:
            return "conflict";
        default:
            return "server_error";
    }
}

} // namespace

// -- Construction -------------------------------------------------------------

AuthGateway::AuthGateway(AuthConfig config,
                         std::shared_ptr<ICredentialStore> store,
                         Clock clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      hasher_(std::make_unique<PasswordHasher>(config_.scrypt)),
      issuer_(std::make_unique<TokenIssuer>(config_, clock)),
      validator_(std::make_unique<TokenValidator>(config_, clock)) {}

AuthGateway::~AuthGateway() = default;

// -- Register -----------------------------------------------------------------

ServiceResult<uint64_t> AuthGateway::registerUser(const RegistrationRequest& request) {
    if (request.username.empty() || request.password.empty()) {
        return ServiceResult<uint64_t>::err(
            ServiceError(ErrorCode::InvalidArgument, "username and password are required"));
    }

    auto hashed = hasher_->hash(request.password);
    if (!hashed) {
        return ServiceResult<uint64_t>::err(hashed.error());
    }

    auto id = store_->insert(request.username, hashed.value().salt, hashed.value().hash);
    if (!id) {
        if (id.error().code() != ErrorCode::DuplicateUsername) {
            TMAUTH_LOG_WARN(LogCategory::Storage,
                            "credential insert failed: " + std::string(id.error().message()));
        }
        return id;
    }

    logForUser(LogLevel::Info, "user registered", request.username);
    return id;
}

// -- Token exchange -----------------------------------------------------------

ServiceResult<TokenResponse> AuthGateway::exchangeToken(const TokenRequest& request) {
    if (request.grantType != kPasswordGrant) {
        return ServiceResult<TokenResponse>::err(
            ServiceError(ErrorCode::UnsupportedGrantType,
                         "grant_type must be \"password\""));
    }
    if (request.username.empty() || request.password.empty()) {
        return ServiceResult<TokenResponse>::err(
            ServiceError(ErrorCode::InvalidArgument, "username and password are required"));
    }

    auto credential = store_->getCredential(request.username);
    if (!credential) {
        // Unknown users look exactly like wrong passwords.
        if (credential.error().code() == ErrorCode::CredentialNotFound) {
            logForUser(LogLevel::Debug, "token exchange for unknown user", request.username);
            return ServiceResult<TokenResponse>::err(
                ServiceError(ErrorCode::InvalidCredentials, std::string(kBadCredentials)));
        }
        TMAUTH_LOG_WARN(LogCategory::Storage, "credential lookup failed: " +
                                                  std::string(credential.error().message()));
        return ServiceResult<TokenResponse>::err(credential.error());
    }

    const auto& stored = credential.value();
    if (!hasher_->verifyPassword(request.password, stored.salt, stored.passwordHash)) {
        logForUser(LogLevel::Debug, "token exchange with wrong password", request.username);
        return ServiceResult<TokenResponse>::err(
            ServiceError(ErrorCode::InvalidCredentials, std::string(kBadCredentials)));
    }

    auto issued = issuer_->issueToken(stored.username);
    if (!issued) {
        TMAUTH_LOG_ERROR(LogCategory::Auth,
                         "token issue failed: " + std::string(issued.error().message()));
        return ServiceResult<TokenResponse>::err(issued.error());
    }

    logForUser(LogLevel::Info, "token issued", stored.username);
    return ServiceResult<TokenResponse>::ok(TokenIssuer::toResponse(issued.value()));
}

// -- Validate -----------------------------------------------------------------

ServiceResult<std::string> AuthGateway::validate(
    std::optional<std::string_view> authorizationHeader) const {
    return validator_->validateToken(authorizationHeader);
}

// -- Transport ----------------------------------------------------------------

void AuthGateway::registerRoutes(IRouteRegistrar& registrar) {
    registrar.addRoute("POST", "/register",
                       [this](const HttpRequest& req) { return handleRegister(req); });
    registrar.addRoute("POST", "/token",
                       [this](const HttpRequest& req) { return handleToken(req); });
    registrar.addRoute("GET", "/validate",
                       [this](const HttpRequest& req) { return handleValidate(req); });
}

HttpHandler AuthGateway::protect(AuthenticatedHandler handler) const {
    return [this, handler = std::move(handler)](const HttpRequest& req) {
        auto username = validate(req.header("Authorization"));
        if (!username) {
            return errorResponse(username.error());
        }
        return handler(req, username.value());
    };
}

HttpResponse AuthGateway::handleRegister(const HttpRequest& request) {
    RegistrationRequest registration;
    registration.username = fieldOrEmpty(request.query, "username");
    registration.password = fieldOrEmpty(request.query, "password");

    auto id = registerUser(registration);
    if (!id) {
        return errorResponse(id.error());
    }
    return HttpResponse::json(201, "{\"id\":" + std::to_string(id.value()) + "}");
}

HttpResponse AuthGateway::handleToken(const HttpRequest& request) {
    auto form = parseFormUrlEncoded(request.body);
    if (!form) {
        return errorResponse(form.error());
    }

    TokenRequest tokenRequest;
    tokenRequest.grantType = fieldOrEmpty(form.value(), "grant_type");
    tokenRequest.username = fieldOrEmpty(form.value(), "username");
    tokenRequest.password = fieldOrEmpty(form.value(), "password");

    auto token = exchangeToken(tokenRequest);
    if (!token) {
        return errorResponse(token.error());
    }

    auto response = HttpResponse::json(200, toJson(token.value()));
    response.setHeader("Cache-Control", "no-store");
    response.setHeader("Pragma", "no-cache");
    return response;
}

HttpResponse AuthGateway::handleValidate(const HttpRequest& request) const {
    auto username = validate(request.header("Authorization"));
    if (!username) {
        return errorResponse(username.error());
    }
    return HttpResponse::json(200, "{\"username\":" + detail::jsonQuote(username.value()) + "}");
}

// -- Error mapping ------------------------------------------------------------

int AuthGateway::statusFor(ErrorCode code) {
    if (foundation::isUnauthenticated(code)) {
        return 401;
    }
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::UnsupportedGrantType:
            return 400;
        case ErrorCode::DuplicateUsername:
            return 409;
        default:
            return 500;
    }
}

HttpResponse AuthGateway::errorResponse(const ServiceError& error) {
    int status = statusFor(error.code());
    std::string message = status == 500 ? std::string("internal server error")
                                        : std::string(error.message());
    if (status == 500) {
        TMAUTH_LOG_ERROR(LogCategory::Auth, std::string(error.subsystem()) + " error: " +
                                                std::string(error.message()));
    }

    std::string body = "{\"error\":" + detail::jsonQuote(errorKind(error.code())) +
                       ",\"message\":" + detail::jsonQuote(message) + "}";
    auto response = HttpResponse::json(status, std::move(body));
    if (status == 401) {
        response.setHeader("WWW-Authenticate", std::string(kBearerScheme));
    }
    return response;
}

std::string AuthGateway::toJson(const TokenResponse& response) {
    return "{\"access_token\":" + detail::jsonQuote(response.accessToken) +
           ",\"token_type\":" + detail::jsonQuote(response.tokenType) +
           ",\"expires_in\":" + std::to_string(response.expiresIn.count()) + "}";
}

}  // namespace tmauth::service
