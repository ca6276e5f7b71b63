#include "../auth_cli.hpp"
#include "../flags.hpp"
#include "../theme.hpp"
#include <api/api_client.hpp>
#include <auth/account_registry.hpp>
#include <auth/env_token.hpp>
#include <core/host.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <ostream>
#include <fmt/format.h>

static const std::vector<FlagSpec> STATUS_FLAGS = {
    {"hostname", 'h', true},
    {"active", 'a', false},
    {"show-token", 't', false},
};

struct StatusEntry {
    std::string host;
    std::string user;       // "" for an environment token not yet resolved
    AuthToken token;
    bool active = false;
    std::string git_protocol;
};

// 'repo', 'read:org'
static std::string display_scopes(const std::string& header) {
    auto scopes = split_list(header, ',');
    if (scopes.empty()) return "none";
    for (auto& s : scopes) s = "'" + s + "'";
    return join(scopes, ", ");
}

// Checks the token against the API and prints one account block. Returns
// false when the token is invalid or the check could not be made.
static bool print_entry(AuthContext& ctx, ApiClient& api, StatusEntry e, bool show_token) {
    auto scopes = api.token_scopes(e.host, e.token.token);
    if (scopes.is_ok() && e.user.empty()) {
        auto login = api.current_login(e.host, e.token.token);
        if (login.is_ok()) {
            e.user = login.value;
        } else {
            scopes = Result<std::string>::From(login);
        }
    }
    std::string who = e.user.empty() ? "unknown" : e.user;

    if (scopes.is_err()) {
        ctx.out << theme::fail(fmt::format("Failed to log in to {} account {} ({})",
                                           e.host, theme::bold(who), e.token.source));
        ctx.out << theme::kv("Active account", e.active ? "true" : "false");
        if (scopes.kind == ErrorKind::Validation) {
            ctx.out << fmt::format("  - The token in {} is invalid.\n", e.token.source);
        } else {
            ctx.out << fmt::format("  - {}\n", scopes.error);
        }
        if (token_source_writeable(e.token.source)) {
            ctx.out << theme::step(fmt::format("To re-authenticate, run: ghx auth login -h {}", e.host));
            ctx.out << theme::step(fmt::format("To forget about this account, run: ghx auth logout -h {} -u {}",
                                               e.host, who));
        }
        return false;
    }

    ctx.out << theme::ok(fmt::format("Logged in to {} account {} ({})",
                                     e.host, theme::bold(who), e.token.source));
    ctx.out << theme::kv("Active account", e.active ? "true" : "false");
    ctx.out << theme::kv("Git operations protocol", e.git_protocol);
    ctx.out << theme::kv("Token", show_token ? e.token.token : mask_token(e.token.token));

    if (expect_scopes(e.token.token)) {
        ctx.out << theme::kv("Token scopes", display_scopes(scopes.value));
        auto check = check_minimum_scopes(scopes.value);
        if (check.is_err()) {
            ctx.out << theme::warn(check.error);
            ctx.out << theme::step(fmt::format("To request missing scopes, run: ghx auth refresh -h {}", e.host));
        }
    }
    return true;
}

static int do_status(AuthContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parse_flags(args, STATUS_FLAGS);
    if (parsed.is_err()) return report(ctx, parsed);
    const ParsedFlags& flags = parsed.value;
    const EnvLookup& env = ctx.shared.env();

    auto hosts = ctx.registry.hosts();
    std::string fallback = ctx.registry.default_host();
    if (token_from_env(fallback, env) &&
        std::find(hosts.begin(), hosts.end(), fallback) == hosts.end()) {
        hosts.insert(hosts.begin(), fallback);
    }

    if (auto h = flags.get("hostname")) {
        std::string wanted = host::normalize(*h);
        if (std::find(hosts.begin(), hosts.end(), wanted) == hosts.end()) {
            return report_error(ctx, fmt::format("You are not logged into any accounts on {}", wanted),
                                ErrorKind::NotLoggedIn);
        }
        hosts = {wanted};
    }

    if (hosts.empty()) {
        ctx.err << "You are not logged into any GitHub hosts. To log in, run: ghx auth login\n";
        return 1;
    }

    ApiClient api(ctx.http);
    bool show_token = flags.has("show-token");
    bool only_active = flags.has("active");
    bool all_ok = true;

    for (size_t i = 0; i < hosts.size(); i++) {
        const std::string& h = hosts[i];
        if (i > 0) ctx.out << "\n";
        ctx.out << theme::section(h);

        std::string protocol = ctx.registry.git_protocol(h);
        auto env_token = token_from_env(h, env);
        if (env_token) {
            StatusEntry e{h, "", *env_token, true, protocol};
            all_ok = print_entry(ctx, api, e, show_token) && all_ok;
        }

        auto active = ctx.registry.active_user(h);
        auto users = ctx.registry.users_for_host(h);
        if (active) {
            auto it = std::find(users.begin(), users.end(), *active);
            if (it != users.end()) std::rotate(users.begin(), it, it + 1);
        }

        for (const auto& u : users) {
            bool is_active = !env_token && active && *active == u;
            if (only_active && !is_active) continue;

            auto token = is_active ? ctx.registry.active_token(h) : ctx.registry.token_for_user(h, u);
            if (token.is_err() || !token.value) {
                std::string why = token.is_err() ? token.error : "no token found";
                ctx.out << theme::fail(fmt::format("Failed to read token for {} account {}: {}",
                                                   h, theme::bold(u), why));
                all_ok = false;
                continue;
            }

            StatusEntry e{h, u, *token.value, is_active, protocol};
            all_ok = print_entry(ctx, api, e, show_token) && all_ok;
        }
    }

    return all_ok ? 0 : 1;
}

void register_status_commands(AuthCLI& cli) {
    cli.add_command("status", do_status, "Display active account and authentication state on each known GitHub host");
}
