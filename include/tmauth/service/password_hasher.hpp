#pragma once

/// @file password_hasher.hpp
/// @brief Per-user salting and adaptive password hashing (scrypt).
///
/// The caller-visible salt is 16 random bytes stored next to the hash.
/// hashPassword() appends those raw bytes to the password and runs scrypt
/// over the concatenation. scrypt itself is given a second, internal salt
/// which is encoded into the PHC output string together with the cost:
///
///   $scrypt$ln=14,r=8,p=1$<base64 internal salt>$<base64 hash>

#include "tmauth/foundation/service_result.hpp"
#include "tmauth/service/auth_types.hpp"

#include <string>
#include <string_view>

namespace tmauth::service {

/// Salt and hash produced for a new credential.
struct HashedPassword {
    std::string hash;
    Salt salt;
};

/// Password hashing engine.
///
/// Stateless apart from its cost parameters; safe to share across threads.
/// Hashing is CPU- and memory-bound and cannot be interrupted.
///
/// @code
///   PasswordHasher hasher;
///   auto salt = PasswordHasher::generateSalt();
///   auto hash = hasher.hashPassword("secret123", salt.value());
///   bool ok = hasher.verifyPassword("secret123", salt.value(), hash.value());
/// @endcode
class PasswordHasher {
public:
    explicit PasswordHasher(ScryptParams params = {});

    /// kSaltLength bytes from the OpenSSL CSPRNG.
    /// Fails with EntropyUnavailable if the random source cannot be read.
    [[nodiscard]] static foundation::ServiceResult<Salt> generateSalt();

    /// scrypt(password || salt) as a PHC string. Fails with HashFailed or
    /// EntropyUnavailable.
    [[nodiscard]] foundation::ServiceResult<std::string> hashPassword(std::string_view password,
                                                                      const Salt& salt) const;

    /// Generate a salt and hash in one step.
    [[nodiscard]] foundation::ServiceResult<HashedPassword> hash(std::string_view password) const;

    /// Recompute with the parameters stored in @p expectedHash and compare
    /// in constant time. Fails closed: a malformed hash is a mismatch.
    [[nodiscard]] bool verifyPassword(std::string_view password,
                                      const Salt& salt,
                                      std::string_view expectedHash) const;

    [[nodiscard]] const ScryptParams& params() const noexcept { return params_; }

private:
    ScryptParams params_;
};

}  // namespace tmauth::service
