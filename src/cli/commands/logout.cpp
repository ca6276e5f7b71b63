#include "../auth_cli.hpp"
#include "../account_selection.hpp"
#include "../flags.hpp"
#include "../theme.hpp"
#include <auth/account_registry.hpp>
#include <ostream>
#include <fmt/format.h>

static const std::vector<FlagSpec> LOGOUT_FLAGS = {
    {"hostname", 'h', true},
    {"user", 'u', true},
};

static int do_logout(AuthContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parse_flags(args, LOGOUT_FLAGS);
    if (parsed.is_err()) return report(ctx, parsed);
    const ParsedFlags& flags = parsed.value;

    auto target = select_logout_account(ctx.registry,
                                        flags.get_or("hostname", ""),
                                        flags.get_or("user", ""),
                                        ctx.prompter);
    if (target.is_err()) return report(ctx, target);
    const HostUser& account = target.value;

    auto writeable = ctx.registry.check_writeable(account.host);
    if (writeable.is_err()) return report(ctx, writeable);

    auto was_active = ctx.registry.active_user(account.host);

    auto r = ctx.registry.logout(account.host, account.user);
    if (r.is_err()) return report(ctx, r);

    ctx.err << theme::ok(fmt::format("Logged out of {} account {}", account.host, theme::bold(account.user)));

    auto now_active = ctx.registry.active_user(account.host);
    if (was_active && *was_active == account.user && now_active) {
        ctx.err << theme::ok(fmt::format("Switched active account for {} to {}",
                                         account.host, theme::bold(*now_active)));
    }
    return 0;
}

void register_logout_commands(AuthCLI& cli) {
    cli.add_command("logout", do_logout, "Log out of a GitHub account");
}
