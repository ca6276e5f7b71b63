#include "config_store.hpp"
#include <core/host.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

// ── hosts.yml ───────────────────────────────────────────────
//
// github.com:
//   user: monalisa            # active account
//   git_protocol: https
//   oauth_token: gho_...      # active slot, insecure storage only
//   users:
//     monalisa:
//       git_protocol: https
//       secure_storage: true
//     hubot:
//       git_protocol: ssh
//       secure_storage: false
//       oauth_token: gho_...

std::string hosts_to_yaml(const HostsData& data) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [name, h] : data.hosts) {
        if (h.users.empty() && h.git_protocol.empty()) continue;

        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        if (!h.active_user.empty()) {
            out << YAML::Key << "user" << YAML::Value << h.active_user;
        }
        if (!h.git_protocol.empty()) {
            out << YAML::Key << "git_protocol" << YAML::Value << h.git_protocol;
        }
        if (h.oauth_token) {
            out << YAML::Key << "oauth_token" << YAML::Value << *h.oauth_token;
        }
        if (!h.users.empty()) {
            out << YAML::Key << "users" << YAML::Value << YAML::BeginMap;
            for (const auto& u : h.users) {
                out << YAML::Key << u.user << YAML::Value << YAML::BeginMap;
                if (!u.git_protocol.empty()) {
                    out << YAML::Key << "git_protocol" << YAML::Value << u.git_protocol;
                }
                out << YAML::Key << "secure_storage" << YAML::Value << u.secure_storage;
                if (u.oauth_token) {
                    out << YAML::Key << "oauth_token" << YAML::Value << *u.oauth_token;
                }
                out << YAML::EndMap;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

static HostEntry parse_host_entry(const YAML::Node& node) {
    HostEntry h;
    h.active_user = node["user"].as<std::string>("");
    h.git_protocol = node["git_protocol"].as<std::string>("");
    if (node["oauth_token"] && node["oauth_token"].IsScalar()) {
        h.oauth_token = node["oauth_token"].as<std::string>();
    }

    // yaml-cpp keeps mapping order, which is the login order.
    if (node["users"] && node["users"].IsMap()) {
        for (const auto& kv : node["users"]) {
            AccountEntry u;
            u.user = kv.first.as<std::string>();
            const YAML::Node& v = kv.second;
            if (v.IsMap()) {
                u.git_protocol = v["git_protocol"].as<std::string>("");
                u.secure_storage = v["secure_storage"].as<bool>(true);
                if (v["oauth_token"] && v["oauth_token"].IsScalar()) {
                    u.oauth_token = v["oauth_token"].as<std::string>();
                }
            }
            h.users.push_back(u);
        }
    }

    // Older single-account layout: only `user` (and maybe `oauth_token`).
    if (!h.active_user.empty() && !h.has_user(h.active_user)) {
        AccountEntry u;
        u.user = h.active_user;
        u.git_protocol = h.git_protocol;
        u.secure_storage = !h.oauth_token.has_value();
        u.oauth_token = h.oauth_token;
        h.users.push_back(u);
    }

    // An active pointer must name a registered account.
    if (!h.active_user.empty() && !h.has_user(h.active_user)) {
        h.active_user.clear();
    }
    return h;
}

Result<HostsData> hosts_from_yaml(const std::string& text) {
    HostsData data;
    if (trimmed(text).empty()) {
        return Result<HostsData>::Ok(data);
    }

    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) {
            return Result<HostsData>::Err(ErrorKind::Storage, "hosts file is not a mapping");
        }
        for (const auto& kv : root) {
            std::string name = host::normalize(kv.first.as<std::string>());
            if (name.empty() || !kv.second.IsMap()) continue;
            if (data.hosts.count(name)) {
                ghx_logf("config: ignoring duplicate hosts entry '{}'", kv.first.as<std::string>());
                continue;
            }
            data.hosts[name] = parse_host_entry(kv.second);
        }
    } catch (const YAML::Exception& e) {
        return Result<HostsData>::Err(ErrorKind::Storage,
            fmt::format("failed to parse hosts file: {}", e.what()));
    }
    return Result<HostsData>::Ok(data);
}

// ── File helpers ────────────────────────────────────────────

static Result<std::string> read_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<std::string>::Ok("");
    }
    std::ifstream f(path);
    if (!f) {
        return Result<std::string>::Err(ErrorKind::Storage,
            fmt::format("failed to read {}", path.string()));
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return Result<std::string>::Ok(ss.str());
}

// Owner-only from creation; the hosts file may hold plaintext tokens.
static Result<void> write_file(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Storage,
            fmt::format("failed to create {}: {}", path.parent_path().string(), ec.message()));
    }
    ec = platform::write_private_file(path, content);
    if (ec) {
        return Result<void>::Err(ErrorKind::Storage,
            fmt::format("failed to write {}: {}", path.string(), ec.message()));
    }
    return Result<void>::Ok();
}

// ── FileConfigStore ─────────────────────────────────────────

FileConfigStore::FileConfigStore(fs::path dir) : dir_(std::move(dir)) {}

Result<void> FileConfigStore::load(Config& config) {
    auto config_text = read_file(get_config_path(dir_));
    if (config_text.is_err()) return Result<void>::From(config_text);

    if (!trimmed(config_text.value).empty()) {
        try {
            YAML::Node root = YAML::Load(config_text.value);
            if (root.IsMap()) {
                for (const auto& opt : config_options()) {
                    if (root[opt.key] && root[opt.key].IsScalar()) {
                        config.settings()[opt.key] = root[opt.key].as<std::string>();
                    }
                }
            }
        } catch (const YAML::Exception& e) {
            return Result<void>::Err(ErrorKind::Storage,
                fmt::format("failed to parse {}: {}", get_config_path(dir_).string(), e.what()));
        }
    }

    auto hosts_text = read_file(get_hosts_path(dir_));
    if (hosts_text.is_err()) return Result<void>::From(hosts_text);

    auto hosts = hosts_from_yaml(hosts_text.value);
    if (hosts.is_err()) return Result<void>::From(hosts);
    config.hosts() = std::move(hosts.value);

    ghx_logf("config: loaded {} host(s) from {}", config.hosts().hosts.size(), dir_.string());
    return Result<void>::Ok();
}

Result<void> FileConfigStore::save(const Config& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [key, value] : config.settings()) {
        out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;

    auto r = write_file(get_config_path(dir_), std::string(out.c_str()) + "\n");
    if (r.is_err()) return r;

    r = write_file(get_hosts_path(dir_), hosts_to_yaml(config.hosts()));
    if (r.is_err()) return r;

    ghx_logf("config: wrote {}", dir_.string());
    return Result<void>::Ok();
}

// ── MemoryConfigStore ───────────────────────────────────────

Result<void> MemoryConfigStore::load(Config& config) {
    config.settings() = settings_;
    config.hosts() = hosts_;
    return Result<void>::Ok();
}

Result<void> MemoryConfigStore::save(const Config& config) {
    if (!fail_next_.empty()) {
        std::string err = fail_next_;
        fail_next_.clear();
        return Result<void>::Err(ErrorKind::Storage, err);
    }
    settings_ = config.settings();
    hosts_ = config.hosts();
    save_count_++;
    return Result<void>::Ok();
}
