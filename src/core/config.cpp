#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    if (auto dir = process_env("GH_CONFIG_DIR")) {
        return fs::path(*dir);
    }
    if (auto xdg = process_env("XDG_CONFIG_HOME")) {
        return fs::path(*xdg) / "ghx";
    }
    return platform::home_dir() / ".config" / "ghx";
}

fs::path get_config_path(const fs::path& dir) {
    return dir / "config.yml";
}

fs::path get_hosts_path(const fs::path& dir) {
    return dir / "hosts.yml";
}

// ── Settings schema ─────────────────────────────────────────

const std::vector<ConfigOption>& config_options() {
    static const std::vector<ConfigOption> options = {
        {"git_protocol", "the protocol to use for git clone and push operations",
         {"https", "ssh"}, "https"},
        {"editor", "the text editor program to use for authoring text", {}, ""},
        {"prompt", "toggle interactive prompting in the terminal",
         {"enabled", "disabled"}, "enabled"},
        {"pager", "the terminal pager program to send standard output to", {}, ""},
        {"browser", "the web browser to use for opening URLs", {}, ""},
        {"http_unix_socket",
         "the path to a Unix domain socket through which to make an HTTP connection", {}, ""},
    };
    return options;
}

const ConfigOption* find_config_option(const std::string& key) {
    for (const auto& opt : config_options()) {
        if (key == opt.key) return &opt;
    }
    return nullptr;
}

std::string default_for_key(const std::string& key) {
    const ConfigOption* opt = find_config_option(key);
    return opt ? opt->default_value : "";
}

// ── Hosts data ──────────────────────────────────────────────

AccountEntry* HostEntry::find_user(const std::string& user) {
    for (auto& u : users) {
        if (u.user == user) return &u;
    }
    return nullptr;
}

const AccountEntry* HostEntry::find_user(const std::string& user) const {
    for (const auto& u : users) {
        if (u.user == user) return &u;
    }
    return nullptr;
}

std::vector<std::string> HostEntry::usernames() const {
    std::vector<std::string> names;
    for (const auto& u : users) names.push_back(u.user);
    return names;
}

HostEntry* HostsData::find(const std::string& hostname) {
    auto it = hosts.find(hostname);
    return it == hosts.end() ? nullptr : &it->second;
}

const HostEntry* HostsData::find(const std::string& hostname) const {
    auto it = hosts.find(hostname);
    return it == hosts.end() ? nullptr : &it->second;
}

// ── Config ──────────────────────────────────────────────────

std::optional<std::string> Config::get(const std::string& hostname, const std::string& key) const {
    std::string env_key = "GH_";
    for (char c : key) env_key += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (auto v = env_(env_key)) {
        return v;
    }

    if (!hostname.empty() && key == "git_protocol") {
        const HostEntry* h = hosts_.find(hostname);
        if (h && !h->git_protocol.empty()) return h->git_protocol;
    }

    auto it = settings_.find(key);
    if (it != settings_.end() && !it->second.empty()) return it->second;
    return std::nullopt;
}

std::string Config::get_or_default(const std::string& hostname, const std::string& key) const {
    auto v = get(hostname, key);
    return v ? *v : default_for_key(key);
}

Result<void> Config::set(const std::string& hostname, const std::string& key, const std::string& value) {
    const ConfigOption* opt = find_config_option(key);
    if (!opt) {
        return Result<void>::Err(ErrorKind::Validation, fmt::format("unknown config key: {}", key));
    }
    if (!opt->allowed_values.empty() &&
        std::find(opt->allowed_values.begin(), opt->allowed_values.end(), value) == opt->allowed_values.end()) {
        return Result<void>::Err(ErrorKind::Validation,
            fmt::format("invalid value for {}: {} (valid values: {})",
                        key, value, join(opt->allowed_values, ", ")));
    }

    if (hostname.empty()) {
        settings_[key] = value;
        return Result<void>::Ok();
    }
    if (key != "git_protocol") {
        return Result<void>::Err(ErrorKind::Validation,
            fmt::format("{} cannot be set per host", key));
    }
    hosts_.hosts[hostname].git_protocol = value;
    return Result<void>::Ok();
}
