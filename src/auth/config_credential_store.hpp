#pragma once

#include <core/shared_config.hpp>
#include <core/constants.hpp>
#include "credential_store.hpp"

// Insecure backend: tokens kept as plaintext `oauth_token` fields in the
// hosts data, persisted with the rest of the config. The active slot is the
// host's `oauth_token`, a per-user slot is the account's.
//
// Operates on SharedConfig's in-memory state only; callers hold its mutex
// and persist with SharedConfig::save().
class ConfigCredentialStore : public CredentialStore {
public:
    explicit ConfigCredentialStore(SharedConfig& shared) : shared_(shared) {}

    Result<std::optional<std::string>> get(const std::string& host,
                                           const std::string& slot) override;
    Result<void> store(const std::string& host,
                       const std::string& slot,
                       const std::string& secret) override;
    Result<void> remove(const std::string& host,
                        const std::string& slot) override;

    const char* source_name() const override { return SOURCE_CONFIG; }

private:
    SharedConfig& shared_;
};
