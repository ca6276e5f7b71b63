#include "account_registry.hpp"
#include "env_token.hpp"
#include <core/host.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <fmt/format.h>

using OptionalToken = Result<std::optional<AuthToken>>;

namespace {

// Undo log for the secret writes of one mutation. Each slot's prior value is
// read before its first write; undo() puts them back newest first. Writes to
// the config-backed store live in the hosts data and come back with its
// snapshot, so they are not recorded.
class SecretJournal {
public:
    explicit SecretJournal(const CredentialStore* config_backed) : config_backed_(config_backed) {}

    Result<void> store(CredentialStore& s, const std::string& host,
                       const std::string& slot, const std::string& secret) {
        auto r = remember(s, host, slot);
        if (r.is_err()) return r;
        return s.store(host, slot, secret);
    }

    Result<void> remove(CredentialStore& s, const std::string& host, const std::string& slot) {
        auto r = remember(s, host, slot);
        if (r.is_err()) return r;
        return s.remove(host, slot);
    }

    void undo() {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            auto r = it->prior ? it->store->store(it->host, it->slot, *it->prior)
                               : it->store->remove(it->host, it->slot);
            if (r.is_err()) {
                ghx_logf("registry: could not restore {} slot '{}' on {}: {}",
                         it->store->source_name(), it->slot, it->host, r.error);
            }
        }
        entries_.clear();
    }

private:
    struct Entry {
        CredentialStore* store;
        std::string host;
        std::string slot;
        std::optional<std::string> prior;
    };

    Result<void> remember(CredentialStore& s, const std::string& host, const std::string& slot) {
        if (&s == config_backed_) return Result<void>::Ok();
        for (const auto& e : entries_) {
            if (e.store == &s && e.host == host && e.slot == slot) return Result<void>::Ok();
        }
        auto prior = s.get(host, slot);
        if (prior.is_err()) return Result<void>::From(prior);
        entries_.push_back(Entry{&s, host, slot, prior.value});
        return Result<void>::Ok();
    }

    const CredentialStore* config_backed_;
    std::vector<Entry> entries_;
};

} // namespace

std::string promote_most_recent(const std::vector<std::string>& remaining) {
    return remaining.empty() ? std::string() : remaining.back();
}

AccountRegistry::AccountRegistry(SharedConfig& shared,
                                 std::shared_ptr<CredentialStore> secure,
                                 std::shared_ptr<CredentialStore> insecure,
                                 PromotionPolicy promote)
    : shared_(shared),
      secure_(std::move(secure)),
      insecure_(std::move(insecure)),
      promote_(promote ? std::move(promote) : PromotionPolicy(promote_most_recent)) {}

// ── Queries ─────────────────────────────────────────────────

std::vector<std::string> AccountRegistry::hosts() const {
    std::lock_guard<std::mutex> lock(shared_.mutex());
    std::vector<std::string> out;
    for (const auto& [name, entry] : shared_.config().hosts().hosts) {
        if (entry.users.empty()) continue;
        if (name == GITHUB_COM) {
            out.insert(out.begin(), name);
        } else {
            out.push_back(name);
        }
    }
    return out;
}

std::vector<std::string> AccountRegistry::users_for_host(const std::string& hostname) const {
    std::lock_guard<std::mutex> lock(shared_.mutex());
    const HostEntry* h = shared_.config().hosts().find(host::normalize(hostname));
    return h ? h->usernames() : std::vector<std::string>{};
}

std::optional<std::string> AccountRegistry::active_user(const std::string& hostname) const {
    std::lock_guard<std::mutex> lock(shared_.mutex());
    const HostEntry* h = shared_.config().hosts().find(host::normalize(hostname));
    if (!h || h->active_user.empty()) return std::nullopt;
    return h->active_user;
}

OptionalToken AccountRegistry::active_token(const std::string& hostname) const {
    std::string host = host::normalize(hostname);
    if (auto env = token_from_env(host, shared_.env())) {
        return OptionalToken::Ok(env);
    }

    std::lock_guard<std::mutex> lock(shared_.mutex());
    const HostEntry* h = shared_.config().hosts().find(host);
    if (!h || h->active_user.empty()) return OptionalToken::Ok(std::nullopt);

    const AccountEntry* u = h->find_user(h->active_user);
    CredentialStore& store = backend_for(u ? u->secure_storage : true);

    auto secret = store.get(host, CredentialStore::ACTIVE_SLOT);
    if (secret.is_err()) return OptionalToken::From(secret);
    if (!secret.value) return OptionalToken::Ok(std::nullopt);
    return OptionalToken::Ok(AuthToken{*secret.value, store.source_name()});
}

OptionalToken AccountRegistry::token_for_user(const std::string& hostname,
                                              const std::string& user) const {
    std::string host = host::normalize(hostname);

    std::lock_guard<std::mutex> lock(shared_.mutex());
    const HostEntry* h = shared_.config().hosts().find(host);
    const AccountEntry* u = h ? h->find_user(user) : nullptr;
    if (!u) return OptionalToken::Ok(std::nullopt);

    CredentialStore& store = backend_for(u->secure_storage);
    auto secret = store.get(host, user);
    if (secret.is_err()) return OptionalToken::From(secret);
    if (!secret.value) return OptionalToken::Ok(std::nullopt);
    return OptionalToken::Ok(AuthToken{*secret.value, store.source_name()});
}

bool AccountRegistry::secure_storage(const std::string& hostname, const std::string& user) const {
    std::lock_guard<std::mutex> lock(shared_.mutex());
    const HostEntry* h = shared_.config().hosts().find(host::normalize(hostname));
    const AccountEntry* u = h ? h->find_user(user) : nullptr;
    return u ? u->secure_storage : true;
}

std::string AccountRegistry::git_protocol(const std::string& hostname) const {
    std::lock_guard<std::mutex> lock(shared_.mutex());
    return shared_.config().git_protocol(host::normalize(hostname));
}

std::string AccountRegistry::default_host() const {
    if (auto env_host = shared_.env()("GH_HOST")) {
        return host::normalize(*env_host);
    }
    auto known = hosts();
    if (known.empty()) return GITHUB_COM;
    return known.front();   // github.com sorts first when present
}

Result<void> AccountRegistry::check_writeable(const std::string& hostname) const {
    auto env = token_from_env(host::normalize(hostname), shared_.env());
    if (env && !token_source_writeable(env->source)) {
        return Result<void>::Err(ErrorKind::WriteProtected,
            fmt::format("The value of the {} environment variable is being used for authentication.\n"
                        "To have ghx manage credentials instead, first clear the value from the environment.",
                        env->source));
    }
    return Result<void>::Ok();
}

// ── Mutations ───────────────────────────────────────────────

Result<void> AccountRegistry::login(const std::string& hostname,
                                    const std::string& user,
                                    const std::string& token,
                                    const std::string& git_protocol,
                                    bool secure_storage) {
    std::string host = host::normalize(hostname);
    if (host.empty() || user.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "hostname and username are required");
    }
    if (token.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "token cannot be empty");
    }
    auto writeable = check_writeable(host);
    if (writeable.is_err()) return writeable;

    std::lock_guard<std::mutex> lock(shared_.mutex());
    HostsData& data = shared_.config().hosts();
    HostsData snapshot = data;
    SecretJournal journal(insecure_.get());
    auto rollback = [&](Result<void> r) {
        journal.undo();
        data = snapshot;
        return r;
    };

    HostEntry& h = data.hosts[host];

    std::optional<bool> prev_active_secure;
    if (const AccountEntry* prev = h.find_user(h.active_user)) {
        prev_active_secure = prev->secure_storage;
    }

    // Re-login moves the account to the end: it is now the most recent.
    AccountEntry entry;
    std::optional<bool> prev_secure;
    auto it = std::find_if(h.users.begin(), h.users.end(),
                           [&](const AccountEntry& a) { return a.user == user; });
    if (it != h.users.end()) {
        prev_secure = it->secure_storage;
        entry = *it;
        h.users.erase(it);
    }
    entry.user = user;
    if (!git_protocol.empty()) entry.git_protocol = git_protocol;
    entry.secure_storage = secure_storage;
    entry.oauth_token.reset();
    h.users.push_back(entry);

    CredentialStore& store = backend_for(secure_storage);
    auto r = journal.store(store, host, user, token);
    if (r.is_err()) return rollback(r);
    r = journal.store(store, host, CredentialStore::ACTIVE_SLOT, token);
    if (r.is_err()) return rollback(r);

    // Clear copies left behind in the other backend.
    if (prev_secure && *prev_secure != secure_storage) {
        r = journal.remove(backend_for(*prev_secure), host, user);
        if (r.is_err()) return rollback(r);
    }
    if (prev_active_secure && *prev_active_secure != secure_storage) {
        r = journal.remove(backend_for(*prev_active_secure), host, CredentialStore::ACTIVE_SLOT);
        if (r.is_err()) return rollback(r);
    }

    h.active_user = user;
    if (!git_protocol.empty()) h.git_protocol = git_protocol;

    r = shared_.save();
    if (r.is_err()) return rollback(r);

    ghx_logf("registry: login {} on {} ({})", user, host, store.source_name());
    return Result<void>::Ok();
}

Result<void> AccountRegistry::logout(const std::string& hostname, const std::string& user) {
    std::string host = host::normalize(hostname);
    auto writeable = check_writeable(host);
    if (writeable.is_err()) return writeable;

    std::lock_guard<std::mutex> lock(shared_.mutex());
    HostsData& data = shared_.config().hosts();

    HostEntry* h = data.find(host);
    if (!h || h->users.empty()) {
        return Result<void>::Err(ErrorKind::NotLoggedIn, fmt::format("not logged in to {}", host));
    }
    const AccountEntry* u = h->find_user(user);
    if (!u) {
        return Result<void>::Err(ErrorKind::NotLoggedIn,
            fmt::format("not logged in to {} account {}", host, user));
    }

    HostsData snapshot = data;
    SecretJournal journal(insecure_.get());
    auto rollback = [&](Result<void> r) {
        journal.undo();
        data = snapshot;
        return r;
    };

    bool was_active = h->active_user == user;
    bool secure = u->secure_storage;

    // Pick and read the successor first so a failure leaves everything intact.
    std::string next;
    bool next_secure = true;
    std::string next_token;
    if (was_active && h->users.size() > 1) {
        std::vector<std::string> remaining;
        for (const auto& a : h->users) {
            if (a.user != user) remaining.push_back(a.user);
        }
        next = promote_(remaining);
        if (std::find(remaining.begin(), remaining.end(), next) == remaining.end()) {
            ghx_logf("registry: promotion policy chose unknown account '{}', using most recent", next);
            next = promote_most_recent(remaining);
        }
        next_secure = h->find_user(next)->secure_storage;

        auto tok = backend_for(next_secure).get(host, next);
        if (tok.is_err()) return Result<void>::From(tok);
        if (!tok.value) {
            return Result<void>::Err(ErrorKind::Storage,
                fmt::format("no token found for {} on {}", next, host));
        }
        next_token = *tok.value;
    }

    CredentialStore& store = backend_for(secure);
    auto r = journal.remove(store, host, user);
    if (r.is_err()) return rollback(r);

    if (was_active && (next.empty() || next_secure != secure)) {
        r = journal.remove(store, host, CredentialStore::ACTIVE_SLOT);
        if (r.is_err()) return rollback(r);
    }

    h->users.erase(std::remove_if(h->users.begin(), h->users.end(),
                                  [&](const AccountEntry& a) { return a.user == user; }),
                   h->users.end());

    if (was_active) {
        h->active_user.clear();
        if (!next.empty()) {
            r = journal.store(backend_for(next_secure), host, CredentialStore::ACTIVE_SLOT, next_token);
            if (r.is_err()) return rollback(r);

            h->active_user = next;
            const AccountEntry* promoted = h->find_user(next);
            if (!promoted->git_protocol.empty()) h->git_protocol = promoted->git_protocol;
        }
    }

    if (h->users.empty()) {
        data.hosts.erase(host);
    }

    r = shared_.save();
    if (r.is_err()) return rollback(r);

    ghx_logf("registry: logout {} from {}{}", user, host,
             next.empty() ? "" : fmt::format(", {} now active", next));
    return Result<void>::Ok();
}

Result<void> AccountRegistry::switch_user(const std::string& hostname, const std::string& user) {
    std::string host = host::normalize(hostname);
    auto writeable = check_writeable(host);
    if (writeable.is_err()) return writeable;

    std::lock_guard<std::mutex> lock(shared_.mutex());
    HostsData& data = shared_.config().hosts();

    HostEntry* h = data.find(host);
    if (!h || h->users.empty()) {
        return Result<void>::Err(ErrorKind::NotLoggedIn, fmt::format("not logged in to {}", host));
    }
    const AccountEntry* target = h->find_user(user);
    if (!target) {
        return Result<void>::Err(ErrorKind::NotAMember,
            fmt::format("not logged in to {} account {}", host, user));
    }
    if (h->active_user == user) {
        return Result<void>::Ok();
    }

    HostsData snapshot = data;
    SecretJournal journal(insecure_.get());
    auto rollback = [&](Result<void> r) {
        journal.undo();
        data = snapshot;
        return r;
    };

    bool target_secure = target->secure_storage;
    std::string target_protocol = target->git_protocol;

    std::optional<bool> prev_secure;
    if (const AccountEntry* prev = h->find_user(h->active_user)) {
        prev_secure = prev->secure_storage;
    }

    CredentialStore& store = backend_for(target_secure);
    auto tok = store.get(host, user);
    if (tok.is_err()) return Result<void>::From(tok);
    if (!tok.value) {
        return Result<void>::Err(ErrorKind::Storage,
            fmt::format("no token found for {} on {}", user, host));
    }

    auto r = journal.store(store, host, CredentialStore::ACTIVE_SLOT, *tok.value);
    if (r.is_err()) return rollback(r);

    if (prev_secure && *prev_secure != target_secure) {
        r = journal.remove(backend_for(*prev_secure), host, CredentialStore::ACTIVE_SLOT);
        if (r.is_err()) return rollback(r);
    }

    h->active_user = user;
    if (!target_protocol.empty()) h->git_protocol = target_protocol;

    r = shared_.save();
    if (r.is_err()) return rollback(r);

    ghx_logf("registry: switched {} to {}", host, user);
    return Result<void>::Ok();
}
