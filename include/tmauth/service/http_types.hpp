#pragma once

/// @file http_types.hpp
/// @brief Transport-neutral HTTP request/response values.

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tmauth::service {

/// Decoded name/value pairs from a query string or form body.
using FormFields = std::unordered_map<std::string, std::string>;

/// Parsed request as delivered to handlers.
struct HttpRequest {
    std::string method;
    std::string path;
    FormFields query;
    /// Header names are stored lower-cased.
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    /// Case-insensitive header lookup.
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

    [[nodiscard]] std::optional<std::string_view> queryParam(std::string_view name) const;

    void setHeader(std::string_view name, std::string value);
};

/// Response produced by a handler.
struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    [[nodiscard]] static HttpResponse json(int status, std::string body);
    [[nodiscard]] static HttpResponse text(int status, std::string body);

    /// Replace an existing header (case-insensitive) or append it.
    void setHeader(std::string_view name, std::string value);

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

/// Standard reason phrase, "Unknown" for codes we never emit.
[[nodiscard]] std::string_view httpReasonPhrase(int status);

}  // namespace tmauth::service
