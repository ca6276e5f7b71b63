#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <core/shared_config.hpp>
#include "credential_store.hpp"

// Picks which remaining account becomes active after the active one logs
// out. Receives the remaining usernames in login order (most recent last)
// and returns one of them.
using PromotionPolicy = std::function<std::string(const std::vector<std::string>& remaining)>;

// Default policy: the most recently logged-in remaining account.
std::string promote_most_recent(const std::vector<std::string>& remaining);

// Hosts, their accounts and the active account per host. Metadata lives in
// SharedConfig; secrets go to the secure or insecure CredentialStore chosen
// per account at login. Every operation takes SharedConfig's mutex for its
// whole read-modify-write cycle.
//
// Invariant after every operation: a host's active user, if set, is one of
// that host's accounts, and a host with no accounts has no active user.
class AccountRegistry {
public:
    AccountRegistry(SharedConfig& shared,
                    std::shared_ptr<CredentialStore> secure,
                    std::shared_ptr<CredentialStore> insecure,
                    PromotionPolicy promote = promote_most_recent);

    // ── Queries ─────────────────────────────────────────────

    // Hosts with at least one account, github.com first.
    std::vector<std::string> hosts() const;
    std::vector<std::string> users_for_host(const std::string& host) const;
    std::optional<std::string> active_user(const std::string& host) const;

    // Environment override first, then the active slot of the active
    // account's backend. Ok(nullopt) if neither exists.
    Result<std::optional<AuthToken>> active_token(const std::string& host) const;

    // The per-user slot for (host, user).
    Result<std::optional<AuthToken>> token_for_user(const std::string& host,
                                                    const std::string& user) const;

    bool secure_storage(const std::string& host, const std::string& user) const;
    std::string git_protocol(const std::string& host) const;

    // GH_HOST, else github.com if logged in there, else the first known
    // host, else github.com.
    std::string default_host() const;

    // WriteProtected when the host's token comes from an environment variable.
    Result<void> check_writeable(const std::string& host) const;

    // ── Mutations ───────────────────────────────────────────

    // Add or replace (host, user), store the token in its per-user slot and
    // make it the active account.
    Result<void> login(const std::string& host,
                       const std::string& user,
                       const std::string& token,
                       const std::string& git_protocol,
                       bool secure_storage);

    // Remove (host, user) and its secret. Logging out the active account
    // promotes another one, or clears the selection if none remain.
    Result<void> logout(const std::string& host, const std::string& user);

    // Make an existing account active by copying its token into the
    // active slot.
    Result<void> switch_user(const std::string& host, const std::string& user);

    SharedConfig& shared() const { return shared_; }

private:
    CredentialStore& backend_for(bool secure) const { return secure ? *secure_ : *insecure_; }

    SharedConfig& shared_;
    std::shared_ptr<CredentialStore> secure_;
    std::shared_ptr<CredentialStore> insecure_;
    PromotionPolicy promote_;
};
