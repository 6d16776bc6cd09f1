/// @file router.cpp
/// @brief Router implementation.

#include "tmauth/service/router.hpp"

#include "tmauth/foundation/service_logger.hpp"

#include <algorithm>

namespace tmauth::service {

using foundation::LogCategory;

void Router::addRoute(std::string method, std::string path, HttpHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& route : routes_) {
        if (route.method == method && route.path == path) {
            route.handler = std::move(handler);
            return;
        }
    }
    TMAUTH_LOG_DEBUG(LogCategory::Http, "route registered: " + method + " " + path);
    routes_.push_back(Route{std::move(method), std::move(path), std::move(handler)});
}

HttpResponse Router::dispatch(const HttpRequest& request) const {
    HttpHandler handler;
    std::string allowed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& route : routes_) {
            if (route.path != request.path) {
                continue;
            }
            if (route.method == request.method) {
                handler = route.handler;
                break;
            }
            if (!allowed.empty()) {
                allowed += ", ";
            }
            allowed += route.method;
        }
    }

    // Invoke outside the lock so handlers run concurrently.
    if (handler) {
        return handler(request);
    }
    if (!allowed.empty()) {
        auto response = HttpResponse::json(
            405, R"({"error":"method_not_allowed","message":"method not allowed"})");
        response.setHeader("Allow", allowed);
        return response;
    }
    return HttpResponse::json(404, R"({"error":"not_found","message":"no such route"})");
}

bool Router::hasRoute(std::string_view method, std::string_view path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(routes_.begin(), routes_.end(), [&](const Route& r) {
        return r.method == method && r.path == path;
    });
}

std::size_t Router::routeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.size();
}

}  // namespace tmauth::service
