#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// ── Paths ───────────────────────────────────────────────────

// $GH_CONFIG_DIR, else $XDG_CONFIG_HOME/ghx, else ~/.config/ghx
fs::path get_config_dir();
fs::path get_config_path(const fs::path& dir = get_config_dir());
fs::path get_hosts_path(const fs::path& dir = get_config_dir());

// ── Settings schema ─────────────────────────────────────────

struct ConfigOption {
    const char* key;
    const char* description;
    std::vector<std::string> allowed_values;
    const char* default_value;
};

const std::vector<ConfigOption>& config_options();
const ConfigOption* find_config_option(const std::string& key);
std::string default_for_key(const std::string& key);

// ── Account metadata (hosts.yml) ────────────────────────────

struct AccountEntry {
    std::string user;
    std::string git_protocol;
    bool secure_storage = true;
    std::optional<std::string> oauth_token;     // per-user slot, insecure storage only
};

struct HostEntry {
    std::string active_user;                    // "" if none
    std::string git_protocol;
    std::optional<std::string> oauth_token;     // active slot, insecure storage only
    std::vector<AccountEntry> users;            // login order, most recent last

    AccountEntry* find_user(const std::string& user);
    const AccountEntry* find_user(const std::string& user) const;
    bool has_user(const std::string& user) const { return find_user(user) != nullptr; }
    std::vector<std::string> usernames() const;
};

struct HostsData {
    std::map<std::string, HostEntry> hosts;

    HostEntry* find(const std::string& hostname);
    const HostEntry* find(const std::string& hostname) const;
};

// ── Config ──────────────────────────────────────────────────

// Global settings from config.yml plus the account metadata from hosts.yml.
// Not thread-safe on its own; share it through SharedConfig.
class Config {
public:
    Config() : env_(process_env) {}
    explicit Config(EnvLookup env) : env_(std::move(env)) {}

    // Lookup order: GH_<KEY> environment variable, host entry (git_protocol),
    // global setting.
    std::optional<std::string> get(const std::string& hostname, const std::string& key) const;
    std::string get_or_default(const std::string& hostname, const std::string& key) const;

    // Empty hostname sets a global key. Unknown keys and values outside an
    // option's allowed set are rejected.
    Result<void> set(const std::string& hostname, const std::string& key, const std::string& value);

    std::string git_protocol(const std::string& hostname) const { return get_or_default(hostname, "git_protocol"); }
    std::optional<std::string> browser() const { return get("", "browser"); }
    bool prompt_enabled() const { return get_or_default("", "prompt") != "disabled"; }

    std::map<std::string, std::string>& settings() { return settings_; }
    const std::map<std::string, std::string>& settings() const { return settings_; }
    HostsData& hosts() { return hosts_; }
    const HostsData& hosts() const { return hosts_; }

    const EnvLookup& env() const { return env_; }

private:
    EnvLookup env_;
    std::map<std::string, std::string> settings_;
    HostsData hosts_;
};
