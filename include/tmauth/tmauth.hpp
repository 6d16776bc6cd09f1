#pragma once

/// @file tmauth.hpp
/// @brief Umbrella header for the task-manager authentication service.

#include "tmauth/core/result.hpp"
#include "tmauth/foundation/config_manager.hpp"
#include "tmauth/foundation/error_code.hpp"
#include "tmauth/foundation/service_error.hpp"
#include "tmauth/foundation/service_logger.hpp"
#include "tmauth/foundation/service_result.hpp"
#include "tmauth/service/auth_config.hpp"
#include "tmauth/service/auth_gateway.hpp"
#include "tmauth/service/auth_types.hpp"
#include "tmauth/service/credential_store.hpp"
#include "tmauth/service/form_codec.hpp"
#include "tmauth/service/http_server.hpp"
#include "tmauth/service/http_types.hpp"
#include "tmauth/service/password_hasher.hpp"
#include "tmauth/service/router.hpp"
#include "tmauth/service/service_runner.hpp"
#include "tmauth/service/token_issuer.hpp"
#include "tmauth/service/token_validator.hpp"
#include "tmauth/version.hpp"
