#include "auth_helpers.hpp"
#include "../flags.hpp"
#include "../prompter.hpp"
#include "../theme.hpp"
#include <api/api_client.hpp>
#include <auth/account_registry.hpp>
#include <auth/device_flow.hpp>
#include <core/constants.hpp>
#include <core/host.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <iterator>
#include <ostream>
#include <fmt/format.h>

static const std::vector<FlagSpec> REFRESH_FLAGS = {
    {"hostname", 'h', true},
    {"scopes", 's', true},
    {"remove-scopes", 'r', true},
    {"reset-scopes", 0, false},
    {"clipboard", 'c', false},
    {"insecure-storage", 0, false},
};

static Result<std::string> refresh_host(AuthContext& ctx, const ParsedFlags& flags) {
    auto known = ctx.registry.hosts();
    if (known.empty()) {
        return Result<std::string>::Err(ErrorKind::NotLoggedIn,
            "not logged in to any hosts. Use 'ghx auth login' to authenticate with a host");
    }

    if (auto h = flags.get("hostname")) {
        std::string wanted = host::normalize(*h);
        if (std::find(known.begin(), known.end(), wanted) == known.end()) {
            return Result<std::string>::Err(ErrorKind::NotLoggedIn,
                fmt::format("not logged in to {}. use 'ghx auth login' to authenticate with this host", wanted));
        }
        return Result<std::string>::Ok(wanted);
    }

    if (known.size() == 1) return Result<std::string>::Ok(known.front());

    if (!ctx.prompter) {
        return Result<std::string>::Err(ErrorKind::AmbiguousSelection,
            "--hostname required when not running interactively");
    }
    auto choice = ctx.prompter->select("What account do you want to refresh auth for?", known);
    if (choice.is_err()) return Result<std::string>::From(choice);
    return Result<std::string>::Ok(known[choice.value]);
}

static int do_refresh(AuthContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parse_flags(args, REFRESH_FLAGS);
    if (parsed.is_err()) return report(ctx, parsed);
    const ParsedFlags& flags = parsed.value;

    auto hostname = refresh_host(ctx, flags);
    if (hostname.is_err()) return report(ctx, hostname);
    const std::string& h = hostname.value;

    auto writeable = ctx.registry.check_writeable(h);
    if (writeable.is_err()) return report(ctx, writeable);

    auto active = ctx.registry.active_user(h);

    // ── Scope set ───────────────────────────────────────────

    std::vector<std::string> previous;
    if (!flags.has("reset-scopes")) {
        auto token = ctx.registry.active_token(h);
        if (token.is_err()) return report(ctx, token);
        if (token.value) {
            ApiClient api(ctx.http);
            auto header = api.token_scopes(h, token.value->token);
            if (header.is_ok()) {
                previous = split_list(header.value, ',');
            } else {
                ctx.err << theme::warn(fmt::format("could not read the current token scopes: {}", header.error));
            }
        }
    }

    std::vector<std::string> minimum(std::begin(DEFAULT_SCOPES), std::end(DEFAULT_SCOPES));
    auto scopes = merge_scopes(minimum, merge_scopes(previous, flags.list("scopes")));

    for (const auto& removed : flags.list("remove-scopes")) {
        if (std::find(minimum.begin(), minimum.end(), removed) != minimum.end()) {
            ctx.err << theme::warn(fmt::format("the '{}' scope is required and cannot be removed", removed));
            continue;
        }
        scopes.erase(std::remove(scopes.begin(), scopes.end(), removed), scopes.end());
    }
    ghx_logf("refresh {}: requesting scopes {}", h, join(scopes, " "));

    // ── Device flow ─────────────────────────────────────────

    DeviceFlow flow(ctx.http, ctx.clock, ctx.sleep);
    auto result = flow.run(h, scopes, make_device_flow_ui(ctx, flags.has("clipboard")));
    if (result.is_err()) return report(ctx, result);

    if (active && *active != result.value.username) {
        return report_error(ctx,
            fmt::format("error refreshing credentials for {}, received credentials for {}, "
                        "did you use the correct account in the browser?",
                        *active, result.value.username),
            ErrorKind::NotAMember);
    }

    bool secure = !flags.has("insecure-storage");
    auto r = ctx.registry.login(h, result.value.username, result.value.token,
                                ctx.registry.git_protocol(h), secure);
    if (r.is_err()) return report(ctx, r);

    ctx.err << theme::ok("Authentication complete.");
    return 0;
}

void register_refresh_commands(AuthCLI& cli) {
    cli.add_command("refresh", do_refresh, "Refresh stored authentication credentials");
}
