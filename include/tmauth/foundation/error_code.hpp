#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the authentication service.

#include <cstdint>
#include <string_view>

namespace tmauth::foundation {

/// Error codes grouped by subsystem.
///
/// Each subsystem owns a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    UnsupportedGrantType = 0x0003,

    // Network (0x0100 - 0x01FF)
    NetworkError = 0x0100,
    ListenFailed = 0x0101,

    // Storage (0x0200 - 0x02FF)
    StorageError = 0x0200,
    DuplicateUsername = 0x0201,
    CredentialNotFound = 0x0202,

    // Auth (0x0500 - 0x05FF): everything the gateway reports as 401.
    TokenExpired = 0x0501,
    InvalidToken = 0x0502,
    TokenMissing = 0x0503,
    MalformedAuthHeader = 0x0504,
    InvalidSignature = 0x0505,
    UnsupportedAlgorithm = 0x0506,
    InvalidClaims = 0x0507,
    InvalidCredentials = 0x0508,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0801,

    // Crypto (0x0900 - 0x09FF)
    CryptoError = 0x0900,
    EntropyUnavailable = 0x0901,
    HashFailed = 0x0902,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto category = static_cast<uint32_t>(code) & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Network";
        case 0x0200: return "Storage";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Crypto";
        default: return "Unknown";
    }
}

/// True for every code the caller should treat as "not authenticated".
constexpr bool isUnauthenticated(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0500;
}

} // namespace tmauth::foundation
