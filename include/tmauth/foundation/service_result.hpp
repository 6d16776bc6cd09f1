#pragma once

/// @file service_result.hpp
/// @brief ServiceResult<T>: Result specialized with ServiceError.

#include "tmauth/core/result.hpp"
#include "tmauth/foundation/service_error.hpp"

namespace tmauth::foundation {

/// Every fallible operation in the service returns ServiceResult<T>
/// instead of throwing.
///
/// @code
///   ServiceResult<std::chrono::hours> parseHours(std::string_view raw) {
///       if (raw.empty()) {
///           return ServiceResult<std::chrono::hours>::err(
///               ServiceError(ErrorCode::ConfigKeyNotFound, "lifetime not set"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using ServiceResult = tmauth::Result<T, ServiceError>;

} // namespace tmauth::foundation
