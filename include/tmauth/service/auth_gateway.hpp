#pragma once

/// @file auth_gateway.hpp
/// @brief Authentication gateway: register, password-grant token exchange, validate.
///
/// Composes PasswordHasher, TokenIssuer, TokenValidator and an
/// ICredentialStore, and adapts them to the HTTP transport through an
/// injected IRouteRegistrar.

#include "tmauth/foundation/service_result.hpp"
#include "tmauth/service/auth_types.hpp"
#include "tmauth/service/http_types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tmauth::service {

class ICredentialStore;
class IRouteRegistrar;
class PasswordHasher;
class TokenIssuer;
class TokenValidator;

/// Handler for a protected resource; receives the authenticated username.
using AuthenticatedHandler =
    std::function<HttpResponse(const HttpRequest&, const std::string& username)>;

/// Authentication gateway.
///
/// Holds no per-request state: every operation may run concurrently with
/// any other. The routes registered by registerRoutes() and the handlers
/// returned by protect() refer to this object, so it must outlive the
/// router it registered with.
///
/// Routes:
///   - POST /register  query: username, password           -> 201 {"id":N}
///   - POST /token     form:  grant_type=password, username, password
///                                                          -> 200 token envelope
///   - GET  /validate  header: Authorization: Bearer <token> -> 200 {"username":"..."}
///
/// @code
///   auto store = std::make_shared<InMemoryCredentialStore>();
///   AuthGateway gateway(config, store);
///   Router router;
///   gateway.registerRoutes(router);
///   router.addRoute("GET", "/expenses", gateway.protect(listExpenses));
/// @endcode
class AuthGateway {
public:
    AuthGateway(AuthConfig config,
                std::shared_ptr<ICredentialStore> store,
                Clock clock = systemClock());

    ~AuthGateway();

    AuthGateway(const AuthGateway&) = delete;
    AuthGateway& operator=(const AuthGateway&) = delete;
    AuthGateway(AuthGateway&&) = delete;
    AuthGateway& operator=(AuthGateway&&) = delete;

    /// Salt, hash and persist a new credential; returns its id.
    /// InvalidArgument for empty fields, DuplicateUsername/StorageError from the store.
    [[nodiscard]] foundation::ServiceResult<uint64_t> registerUser(
        const RegistrationRequest& request);

    /// Password grant. UnsupportedGrantType unless grant_type is "password";
    /// InvalidCredentials for an unknown user or a wrong password.
    [[nodiscard]] foundation::ServiceResult<TokenResponse> exchangeToken(
        const TokenRequest& request);

    /// Validate a raw Authorization header value and return the username.
    [[nodiscard]] foundation::ServiceResult<std::string> validate(
        std::optional<std::string_view> authorizationHeader) const;

    /// Register the three auth routes.
    void registerRoutes(IRouteRegistrar& registrar);

    /// Wrap a business handler so it only runs for a valid bearer token.
    [[nodiscard]] HttpHandler protect(AuthenticatedHandler handler) const;

    // -- Transport adapters ---------------------------------------------------

    [[nodiscard]] HttpResponse handleRegister(const HttpRequest& request);
    [[nodiscard]] HttpResponse handleToken(const HttpRequest& request);
    [[nodiscard]] HttpResponse handleValidate(const HttpRequest& request) const;

    /// HTTP status for an error code.
    [[nodiscard]] static int statusFor(foundation::ErrorCode code);

    /// JSON error response {"error":kind,"message":...}. Internal errors
    /// get a generic message; 401s carry WWW-Authenticate: Bearer.
    [[nodiscard]] static HttpResponse errorResponse(const foundation::ServiceError& error);

    /// Serialize a token envelope with access_token, token_type, expires_in.
    [[nodiscard]] static std::string toJson(const TokenResponse& response);

private:
    AuthConfig config_;
    std::shared_ptr<ICredentialStore> store_;
    std::unique_ptr<PasswordHasher> hasher_;
    std::unique_ptr<TokenIssuer> issuer_;
    std::unique_ptr<TokenValidator> validator_;
};

}  // namespace tmauth::service
