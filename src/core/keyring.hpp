#pragma once

#include <string>
#include <memory>
#include <optional>
#include "types.hpp"

// Raw access to the OS credential store, addressed by (service, account).
// These calls may block indefinitely (e.g. an unlock prompt nobody answers);
// KeyringCredentialStore wraps every call with a deadline.
class KeyringBackend {
public:
    virtual ~KeyringBackend() = default;

    // A missing entry is Ok(nullopt), not an error.
    virtual Result<std::optional<std::string>> get(const std::string& service,
                                                   const std::string& account) = 0;

    virtual Result<void> set(const std::string& service,
                             const std::string& account,
                             const std::string& secret) = 0;

    // Removing a missing entry succeeds.
    virtual Result<void> remove(const std::string& service,
                                const std::string& account) = 0;

    virtual const char* name() const = 0;

    // True when secrets sit unencrypted on disk rather than in an OS keychain.
    virtual bool plaintext() const { return false; }
};

// The platform keychain selected at build time: libsecret on Linux,
// Keychain Services on macOS, Credential Manager on Windows, or an
// owner-only file when none of those is available.
std::shared_ptr<KeyringBackend> make_system_keyring();
