#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic helpers built on OpenSSL 3.x.
///
/// Random bytes, HMAC-SHA-256, scrypt, base64/base64url and constant-time
/// comparison. Used by PasswordHasher, TokenIssuer and TokenValidator.

#include "tmauth/foundation/error_code.hpp"
#include "tmauth/foundation/service_error.hpp"
#include "tmauth/foundation/service_result.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace tmauth::service::detail {

using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

/// Most recent OpenSSL error as text, or @p fallback if the queue is empty.
inline std::string opensslError(std::string_view fallback) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return std::string(fallback);
    }
    std::array<char, 256> buf{};
    ERR_error_string_n(code, buf.data(), buf.size());
    ERR_clear_error();
    return std::string(fallback) + ": " + buf.data();
}

// =============================================================================
// Randomness
// =============================================================================

/// @p count bytes from the OpenSSL CSPRNG, or EntropyUnavailable.
[[nodiscard]] inline ServiceResult<std::vector<uint8_t>> randomBytes(std::size_t count) {
    std::vector<uint8_t> buf(count);
    if (count > 0 && RAND_bytes(buf.data(), static_cast<int>(count)) != 1) {
        return ServiceResult<std::vector<uint8_t>>::err(
            ServiceError(ErrorCode::EntropyUnavailable,
                         opensslError("random source unavailable")));
    }
    return ServiceResult<std::vector<uint8_t>>::ok(std::move(buf));
}

// =============================================================================
// HMAC-SHA-256
// =============================================================================

using Sha256Digest = std::array<uint8_t, 32>;

[[nodiscard]] inline ServiceResult<Sha256Digest> hmacSha256(std::string_view key,
                                                            std::string_view message) {
    Sha256Digest mac{};
    unsigned int macLen = 0;
    auto* out = HMAC(EVP_sha256(),
                     key.data(), static_cast<int>(key.size()),
                     reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                     mac.data(), &macLen);
    if (out == nullptr || macLen != mac.size()) {
        return ServiceResult<Sha256Digest>::err(
            ServiceError(ErrorCode::CryptoError, opensslError("HMAC-SHA256 failed")));
    }
    return ServiceResult<Sha256Digest>::ok(mac);
}

// =============================================================================
// scrypt (RFC 7914)
// =============================================================================

/// Derive @p outLen bytes with scrypt. N = 2^log2N.
[[nodiscard]] inline ServiceResult<std::vector<uint8_t>> scrypt(
    const std::vector<uint8_t>& input, const std::vector<uint8_t>& salt,
    uint32_t log2N, uint32_t r, uint32_t p, std::size_t outLen) {
    if (log2N == 0 || log2N > 30 || r == 0 || p == 0) {
        return ServiceResult<std::vector<uint8_t>>::err(
            ServiceError(ErrorCode::HashFailed, "invalid scrypt parameters"));
    }
    const uint64_t n = uint64_t{1} << log2N;
    // EVP_PBE_scrypt needs room for V (128*r*(N+2)) and B (128*r*p).
    const uint64_t maxmem = 128ULL * r * (n + 2) + 128ULL * r * p + (1ULL << 20);

    std::vector<uint8_t> out(outLen);
    int rc = EVP_PBE_scrypt(reinterpret_cast<const char*>(input.data()), input.size(),
                            salt.data(), salt.size(),
                            n, r, p, maxmem,
                            out.data(), out.size());
    if (rc != 1) {
        return ServiceResult<std::vector<uint8_t>>::err(
            ServiceError(ErrorCode::HashFailed, opensslError("scrypt derivation failed")));
    }
    return ServiceResult<std::vector<uint8_t>>::ok(std::move(out));
}

// =============================================================================
// Base64 (RFC 4648), unpadded
// =============================================================================

inline constexpr std::string_view kBase64UrlAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

inline constexpr std::string_view kBase64StdAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

/// Encode without '=' padding using the given 64-character alphabet.
[[nodiscard]] inline std::string base64Encode(const uint8_t* data, std::size_t length,
                                              std::string_view alphabet) {
    std::string result;
    result.reserve((length * 4 + 2) / 3);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }
        result.push_back(alphabet[(n >> 18) & 0x3F]);
        result.push_back(alphabet[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(alphabet[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(alphabet[n & 0x3F]);
        }
    }
    return result;
}

/// Strict unpadded decode: rejects padding, foreign characters and
/// impossible lengths.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> base64Decode(std::string_view input,
                                                                      std::string_view alphabet) {
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }
    std::vector<uint8_t> result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        auto pos = alphabet.find(c);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        buf = (buf << 6) | static_cast<uint32_t>(pos);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    return result;
}

[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    return base64Encode(data, length, kBase64UrlAlphabet);
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/// Decode base64url into a byte string.
[[nodiscard]] inline std::optional<std::string> base64urlDecodeString(std::string_view input) {
    auto bytes = base64Decode(input, kBase64UrlAlphabet);
    if (!bytes) {
        return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
}

// =============================================================================
// Constant-time comparison
// =============================================================================

[[nodiscard]] inline bool constantTimeEqual(const void* a, std::size_t aLen,
                                            const void* b, std::size_t bLen) {
    if (aLen != bLen) {
        return false;
    }
    return aLen == 0 || CRYPTO_memcmp(a, b, aLen) == 0;
}

[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    return constantTimeEqual(a.data(), a.size(), b.data(), b.size());
}

}  // namespace tmauth::service::detail
