#include "../auth_cli.hpp"
#include "../account_selection.hpp"
#include "../flags.hpp"
#include "../theme.hpp"
#include <auth/account_registry.hpp>
#include <ostream>
#include <fmt/format.h>

static const std::vector<FlagSpec> SWITCH_FLAGS = {
    {"hostname", 'h', true},
    {"user", 'u', true},
};

static int do_switch(AuthContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parse_flags(args, SWITCH_FLAGS);
    if (parsed.is_err()) return report(ctx, parsed);
    const ParsedFlags& flags = parsed.value;

    std::string user_filter = flags.get_or("user", "");
    auto target = select_switch_account(ctx.registry,
                                        flags.get_or("hostname", ""),
                                        user_filter,
                                        ctx.prompter);
    if (target.is_err()) return report(ctx, target);
    const HostUser& account = target.value.account;

    if (target.value.already_active) {
        if (user_filter.empty()) {
            ctx.err << theme::warn(fmt::format(
                "{} is the only account on {}; there is nothing to switch to", account.user, account.host));
        } else {
            ctx.err << theme::ok(fmt::format("{} is already the active account for {}",
                                             account.user, account.host));
        }
        return 0;
    }

    auto writeable = ctx.registry.check_writeable(account.host);
    if (writeable.is_err()) return report(ctx, writeable);

    auto r = ctx.registry.switch_user(account.host, account.user);
    if (r.is_err()) {
        ctx.err << theme::fail(fmt::format("Failed to switch account for {} to {}", account.host, account.user));
        return report(ctx, r);
    }

    ctx.err << theme::ok(fmt::format("Switched active account for {} to {}",
                                     account.host, theme::bold(account.user)));
    return 0;
}

void register_switch_commands(AuthCLI& cli) {
    cli.add_command("switch", do_switch, "Switch active GitHub account");
}
