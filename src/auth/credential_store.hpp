#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// Secret storage for one backend, addressed by (host, slot). A slot is a
// username (the durable per-user copy) or ACTIVE_SLOT, which mirrors the
// token of whichever account is currently active on the host.
class CredentialStore {
public:
    static constexpr const char* ACTIVE_SLOT = "";

    virtual ~CredentialStore() = default;

    // Ok(nullopt) when nothing is stored.
    virtual Result<std::optional<std::string>> get(const std::string& host,
                                                   const std::string& slot) = 0;

    virtual Result<void> store(const std::string& host,
                               const std::string& slot,
                               const std::string& secret) = 0;

    // Removing a missing entry is not an error.
    virtual Result<void> remove(const std::string& host,
                                const std::string& slot) = 0;

    // Reported as the token source: "keyring" or "config".
    virtual const char* source_name() const = 0;
};
