#include "config_credential_store.hpp"
#include <fmt/format.h>

Result<std::optional<std::string>> ConfigCredentialStore::get(const std::string& host,
                                                              const std::string& slot) {
    const HostEntry* h = shared_.config().hosts().find(host);
    if (!h) return Result<std::optional<std::string>>::Ok(std::nullopt);

    if (slot.empty()) {
        return Result<std::optional<std::string>>::Ok(h->oauth_token);
    }
    const AccountEntry* u = h->find_user(slot);
    if (!u) return Result<std::optional<std::string>>::Ok(std::nullopt);
    return Result<std::optional<std::string>>::Ok(u->oauth_token);
}

Result<void> ConfigCredentialStore::store(const std::string& host,
                                          const std::string& slot,
                                          const std::string& secret) {
    if (slot.empty()) {
        shared_.config().hosts().hosts[host].oauth_token = secret;
        return Result<void>::Ok();
    }

    // Per-user slots live on the account record, which the registry creates first.
    HostEntry* h = shared_.config().hosts().find(host);
    AccountEntry* u = h ? h->find_user(slot) : nullptr;
    if (!u) {
        return Result<void>::Err(ErrorKind::Storage,
            fmt::format("no account {} on {} to store a token for", slot, host));
    }
    u->oauth_token = secret;
    return Result<void>::Ok();
}

Result<void> ConfigCredentialStore::remove(const std::string& host,
                                           const std::string& slot) {
    HostEntry* h = shared_.config().hosts().find(host);
    if (!h) return Result<void>::Ok();

    if (slot.empty()) {
        h->oauth_token.reset();
        return Result<void>::Ok();
    }
    if (AccountEntry* u = h->find_user(slot)) {
        u->oauth_token.reset();
    }
    return Result<void>::Ok();
}
