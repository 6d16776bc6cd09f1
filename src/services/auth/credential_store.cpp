/// @file credential_store.cpp
/// @brief InMemoryCredentialStore implementation.

#include "tmauth/service/credential_store.hpp"

#include <chrono>

namespace tmauth::service {

using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

ServiceResult<uint64_t> InMemoryCredentialStore::insert(std::string_view username,
                                                        const Salt& salt,
                                                        std::string_view passwordHash) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key(username);
    if (byUsername_.count(key) > 0) {
        return ServiceResult<uint64_t>::err(
            ServiceError(ErrorCode::DuplicateUsername, "username already exists"));
    }

    Credential credential;
    credential.id = nextId_++;
    credential.username = key;
    credential.salt = salt;
    credential.passwordHash = std::string(passwordHash);
    credential.createdAt = std::chrono::system_clock::now();

    auto id = credential.id;
    byUsername_.emplace(std::move(key), std::move(credential));
    return ServiceResult<uint64_t>::ok(id);
}

ServiceResult<Credential> InMemoryCredentialStore::getCredential(
    std::string_view username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byUsername_.find(std::string(username));
    if (it == byUsername_.end()) {
        return ServiceResult<Credential>::err(
            ServiceError(ErrorCode::CredentialNotFound, "credential not found"));
    }
    return ServiceResult<Credential>::ok(it->second);
}

std::size_t InMemoryCredentialStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return byUsername_.size();
}

} // namespace tmauth::service
