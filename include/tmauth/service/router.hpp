#pragma once

/// @file router.hpp
/// @brief Method + path routing for the HTTP transport.
///
/// Components that expose endpoints receive an IRouteRegistrar and
/// register against it; nothing is attached to a process-global router.

#include "tmauth/service/http_types.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tmauth::service {

/// Registration side of a router.
class IRouteRegistrar {
public:
    virtual ~IRouteRegistrar() = default;

    /// Bind @p handler to an exact method and path. Re-registering the
    /// same pair replaces the previous handler.
    virtual void addRoute(std::string method, std::string path, HttpHandler handler) = 0;
};

/// Exact-match router.
///
/// dispatch() returns 404 for an unknown path and 405 (with an Allow
/// header) when the path exists under other methods.
///
/// @code
///   Router router;
///   gateway.registerRoutes(router);
///   auto response = router.dispatch(request);
/// @endcode
class Router : public IRouteRegistrar {
public:
    void addRoute(std::string method, std::string path, HttpHandler handler) override;

    [[nodiscard]] HttpResponse dispatch(const HttpRequest& request) const;

    [[nodiscard]] bool hasRoute(std::string_view method, std::string_view path) const;

    [[nodiscard]] std::size_t routeCount() const;

private:
    struct Route {
        std::string method;
        std::string path;
        HttpHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Route> routes_;
};

}  // namespace tmauth::service
