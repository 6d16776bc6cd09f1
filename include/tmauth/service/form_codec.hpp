#pragma once

/// @file form_codec.hpp
/// @brief application/x-www-form-urlencoded and request-target decoding.

#include "tmauth/foundation/service_result.hpp"
#include "tmauth/service/http_types.hpp"

#include <string>
#include <string_view>

namespace tmauth::service {

/// Decode %XX escapes; '+' becomes a space when @p plusAsSpace is set.
/// A truncated or non-hex escape is InvalidArgument.
[[nodiscard]] foundation::ServiceResult<std::string> percentDecode(std::string_view input,
                                                                   bool plusAsSpace = true);

/// Decode "a=1&b=2". The first occurrence of a repeated name wins;
/// a pair without '=' maps to the empty string.
[[nodiscard]] foundation::ServiceResult<FormFields> parseFormUrlEncoded(std::string_view body);

/// Path and decoded query of a request target such as "/register?username=alice".
struct RequestTarget {
    std::string path;
    FormFields query;
};

[[nodiscard]] foundation::ServiceResult<RequestTarget> parseRequestTarget(std::string_view target);

}  // namespace tmauth::service
