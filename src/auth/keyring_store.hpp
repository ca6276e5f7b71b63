#pragma once

#include <chrono>
#include <string>
#include <memory>
#include <core/keyring.hpp>
#include <core/constants.hpp>
#include "credential_store.hpp"

// Secure backend: the OS keychain, service "gh:<host>", account = slot.
// Every call is bounded by a deadline so a hung unlock prompt cannot
// freeze the process.
class KeyringCredentialStore : public CredentialStore {
public:
    explicit KeyringCredentialStore(
        std::shared_ptr<KeyringBackend> backend,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(KEYRING_TIMEOUT_MS));

    Result<std::optional<std::string>> get(const std::string& host,
                                           const std::string& slot) override;
    Result<void> store(const std::string& host,
                       const std::string& slot,
                       const std::string& secret) override;
    Result<void> remove(const std::string& host,
                        const std::string& slot) override;

    // "keyring", or "keyring (file)" when the backend is the plaintext file.
    const char* source_name() const override { return source_.c_str(); }

private:
    std::shared_ptr<KeyringBackend> backend_;
    std::chrono::milliseconds timeout_;
    std::string source_;
};

std::string keyring_service(const std::string& host);
