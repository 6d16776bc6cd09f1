/// @file password_hasher.cpp
/// @brief PasswordHasher implementation: external salt + scrypt in PHC format.

#include "tmauth/service/password_hasher.hpp"

#include "tmauth/foundation/service_logger.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <optional>
#include <vector>

namespace tmauth::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

constexpr std::string_view kPhcPrefix = "$scrypt$";
constexpr std::size_t kInternalSaltLength = 16;
constexpr std::size_t kDerivedKeyLength = 32;

struct PhcRecord {
    ScryptParams params;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> hash;
};

std::vector<uint8_t> concat(std::string_view password, const Salt& salt) {
    std::vector<uint8_t> input;
    input.reserve(password.size() + salt.size());
    input.insert(input.end(), password.begin(), password.end());
    input.insert(input.end(), salt.begin(), salt.end());
    return input;
}

std::string serializePhc(const ScryptParams& params,
                         const std::vector<uint8_t>& salt,
                         const std::vector<uint8_t>& hash) {
    std::string out(kPhcPrefix);
    out += "ln=" + std::to_string(params.log2N);
    out += ",r=" + std::to_string(params.r);
    out += ",p=" + std::to_string(params.p);
    out += '$';
    out += detail::base64Encode(salt.data(), salt.size(), detail::kBase64StdAlphabet);
    out += '$';
    out += detail::base64Encode(hash.data(), hash.size(), detail::kBase64StdAlphabet);
    return out;
}

std::optional<uint32_t> parseParam(std::string_view field, std::string_view name) {
    if (field.size() <= name.size() + 1 || field.substr(0, name.size()) != name ||
        field[name.size()] != '=') {
        return std::nullopt;
    }
    auto digits = field.substr(name.size() + 1);
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

/// Parse "$scrypt$ln=N,r=R,p=P$salt$hash".
std::optional<PhcRecord> parsePhc(std::string_view encoded) {
    if (encoded.substr(0, kPhcPrefix.size()) != kPhcPrefix) {
        return std::nullopt;
    }
    auto rest = encoded.substr(kPhcPrefix.size());

    auto d1 = rest.find('$');
    if (d1 == std::string_view::npos) {
        return std::nullopt;
    }
    auto d2 = rest.find('$', d1 + 1);
    if (d2 == std::string_view::npos || rest.find('$', d2 + 1) != std::string_view::npos) {
        return std::nullopt;
    }
    auto paramPart = rest.substr(0, d1);
    auto saltPart = rest.substr(d1 + 1, d2 - d1 - 1);
    auto hashPart = rest.substr(d2 + 1);

    auto c1 = paramPart.find(',');
    auto c2 = c1 == std::string_view::npos ? c1 : paramPart.find(',', c1 + 1);
    if (c2 == std::string_view::npos) {
        return std::nullopt;
    }
    auto ln = parseParam(paramPart.substr(0, c1), "ln");
    auto r = parseParam(paramPart.substr(c1 + 1, c2 - c1 - 1), "r");
    auto p = parseParam(paramPart.substr(c2 + 1), "p");
    if (!ln || !r || !p) {
        return std::nullopt;
    }
    ScryptParams params{*ln, *r, *p};
    if (!scryptParamsWithinLimits(params)) {
        return std::nullopt;
    }

    auto salt = detail::base64Decode(saltPart, detail::kBase64StdAlphabet);
    auto hash = detail::base64Decode(hashPart, detail::kBase64StdAlphabet);
    if (!salt || !hash || salt->empty() || hash->empty()) {
        return std::nullopt;
    }
    return PhcRecord{params, std::move(*salt), std::move(*hash)};
}

} // namespace

PasswordHasher::PasswordHasher(ScryptParams params) : params_(params) {}

ServiceResult<Salt> PasswordHasher::generateSalt() {
    auto bytes = detail::randomBytes(kSaltLength);
    if (!bytes) {
        TMAUTH_LOG_ERROR(LogCategory::Crypto, "salt generation failed: " +
                                                  std::string(bytes.error().message()));
        return ServiceResult<Salt>::err(bytes.error());
    }
    return ServiceResult<Salt>::ok(std::move(bytes).value());
}

ServiceResult<std::string> PasswordHasher::hashPassword(std::string_view password,
                                                        const Salt& salt) const {
    if (!scryptParamsWithinLimits(params_)) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::HashFailed, "scrypt cost exceeds the configured limits"));
    }
    auto internalSalt = detail::randomBytes(kInternalSaltLength);
    if (!internalSalt) {
        return ServiceResult<std::string>::err(internalSalt.error());
    }

    auto derived = detail::scrypt(concat(password, salt), internalSalt.value(),
                                  params_.log2N, params_.r, params_.p, kDerivedKeyLength);
    if (!derived) {
        TMAUTH_LOG_ERROR(LogCategory::Crypto, std::string(derived.error().message()));
        return ServiceResult<std::string>::err(derived.error());
    }
    return ServiceResult<std::string>::ok(
        serializePhc(params_, internalSalt.value(), derived.value()));
}

ServiceResult<HashedPassword> PasswordHasher::hash(std::string_view password) const {
    auto salt = generateSalt();
    if (!salt) {
        return ServiceResult<HashedPassword>::err(salt.error());
    }
    auto digest = hashPassword(password, salt.value());
    if (!digest) {
        return ServiceResult<HashedPassword>::err(digest.error());
    }
    return ServiceResult<HashedPassword>::ok(
        HashedPassword{std::move(digest).value(), std::move(salt).value()});
}

bool PasswordHasher::verifyPassword(std::string_view password,
                                    const Salt& salt,
                                    std::string_view expectedHash) const {
    auto record = parsePhc(expectedHash);
    if (!record) {
        TMAUTH_LOG_WARN(LogCategory::Crypto, "stored password hash is malformed");
        return false;
    }

    auto derived = detail::scrypt(concat(password, salt), record->salt,
                                  record->params.log2N, record->params.r, record->params.p,
                                  record->hash.size());
    if (!derived) {
        TMAUTH_LOG_ERROR(LogCategory::Crypto, std::string(derived.error().message()));
        return false;
    }
    return detail::constantTimeEqual(derived.value().data(), derived.value().size(),
                                     record->hash.data(), record->hash.size());
}

}  // namespace tmauth::service
