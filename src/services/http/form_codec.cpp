/// @file form_codec.cpp
/// @brief URL-encoded form and request-target decoding.

#include "tmauth/service/form_codec.hpp"

namespace tmauth::service {

using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

ServiceResult<std::string> percentDecode(std::string_view input, bool plusAsSpace) {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '+' && plusAsSpace) {
            out.push_back(' ');
            continue;
        }
        if (c != '%') {
            out.push_back(c);
            continue;
        }
        if (i + 2 >= input.size()) {
            return ServiceResult<std::string>::err(
                ServiceError(ErrorCode::InvalidArgument, "truncated percent escape"));
        }
        int hi = hexValue(input[i + 1]);
        int lo = hexValue(input[i + 2]);
        if (hi < 0 || lo < 0) {
            return ServiceResult<std::string>::err(
                ServiceError(ErrorCode::InvalidArgument, "invalid percent escape"));
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return ServiceResult<std::string>::ok(std::move(out));
}

ServiceResult<FormFields> parseFormUrlEncoded(std::string_view body) {
    FormFields fields;
    std::size_t start = 0;
    while (start <= body.size()) {
        auto amp = body.find('&', start);
        auto pair = body.substr(start, amp == std::string_view::npos ? amp : amp - start);

        if (!pair.empty()) {
            auto eq = pair.find('=');
            auto rawName = pair.substr(0, eq);
            auto rawValue = eq == std::string_view::npos ? std::string_view{}
                                                         : pair.substr(eq + 1);
            auto name = percentDecode(rawName);
            if (!name) {
                return ServiceResult<FormFields>::err(name.error());
            }
            auto value = percentDecode(rawValue);
            if (!value) {
                return ServiceResult<FormFields>::err(value.error());
            }
            fields.emplace(std::move(name).value(), std::move(value).value());
        }

        if (amp == std::string_view::npos) {
            break;
        }
        start = amp + 1;
    }
    return ServiceResult<FormFields>::ok(std::move(fields));
}

ServiceResult<RequestTarget> parseRequestTarget(std::string_view target) {
    if (target.empty() || target.front() != '/') {
        return ServiceResult<RequestTarget>::err(
            ServiceError(ErrorCode::InvalidArgument, "request target must start with '/'"));
    }

    // Fragments are never sent by conforming clients; drop one if present.
    target = target.substr(0, target.find('#'));
    auto qpos = target.find('?');
    auto rawPath = target.substr(0, qpos);
    auto rawQuery = qpos == std::string_view::npos ? std::string_view{}
                                                   : target.substr(qpos + 1);

    auto path = percentDecode(rawPath, false);
    if (!path) {
        return ServiceResult<RequestTarget>::err(path.error());
    }
    auto query = parseFormUrlEncoded(rawQuery);
    if (!query) {
        return ServiceResult<RequestTarget>::err(query.error());
    }
    return ServiceResult<RequestTarget>::ok(
        RequestTarget{std::move(path).value(), std::move(query).value()});
}

} // namespace tmauth::service
