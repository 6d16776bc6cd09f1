#pragma once

/// @file credential_store.hpp
/// @brief Credential persistence interface and in-memory implementation.
///
/// The gateway only ever inserts a credential and reads one back by
/// username. Uniqueness of usernames is the store's responsibility and
/// must be enforced atomically on insert.

#include "tmauth/foundation/service_result.hpp"
#include "tmauth/service/auth_types.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tmauth::service {

/// Abstract credential store.
///
/// Implementations must be thread-safe; concurrent inserts of the same
/// username must result in exactly one success.
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    /// Persist a new credential and return its id.
    /// Fails with DuplicateUsername or StorageError.
    [[nodiscard]] virtual foundation::ServiceResult<uint64_t> insert(
        std::string_view username, const Salt& salt, std::string_view passwordHash) = 0;

    /// Fetch a credential by exact username.
    /// Fails with CredentialNotFound or StorageError.
    [[nodiscard]] virtual foundation::ServiceResult<Credential> getCredential(
        std::string_view username) const = 0;
};

/// Thread-safe in-memory store for development and tests.
class InMemoryCredentialStore : public ICredentialStore {
public:
    [[nodiscard]] foundation::ServiceResult<uint64_t> insert(
        std::string_view username, const Salt& salt, std::string_view passwordHash) override;

    [[nodiscard]] foundation::ServiceResult<Credential> getCredential(
        std::string_view username) const override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Credential> byUsername_;
    uint64_t nextId_ = 1;
};

}  // namespace tmauth::service
