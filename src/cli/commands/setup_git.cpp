#include "auth_helpers.hpp"
#include "../flags.hpp"
#include "../theme.hpp"
#include <auth/account_registry.hpp>
#include <core/host.hpp>
#include <algorithm>
#include <ostream>
#include <fmt/format.h>

static const std::vector<FlagSpec> SETUP_GIT_FLAGS = {
    {"hostname", 'h', true},
    {"force", 'f', false},
};

static int do_setup_git(AuthContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parse_flags(args, SETUP_GIT_FLAGS);
    if (parsed.is_err()) return report(ctx, parsed);
    const ParsedFlags& flags = parsed.value;

    bool force = flags.has("force");
    if (force && !flags.has("hostname")) {
        return report_error(ctx, "`--force` must be used in conjunction with `--hostname`",
                            ErrorKind::Validation);
    }

    auto known = ctx.registry.hosts();
    std::vector<std::string> targets;

    if (auto h = flags.get("hostname")) {
        std::string wanted = host::normalize(*h);
        if (!force && std::find(known.begin(), known.end(), wanted) == known.end()) {
            return report_error(ctx,
                fmt::format("You are not logged into the GitHub host \"{}\". Run ghx auth login -h {} "
                            "to authenticate or provide `--force`", wanted, wanted),
                ErrorKind::NotLoggedIn);
        }
        targets.push_back(wanted);
    } else {
        if (known.empty()) {
            return report_error(ctx,
                "You are not logged into any GitHub hosts. Run ghx auth login to authenticate.",
                ErrorKind::NotLoggedIn);
        }
        targets = known;
    }

    for (const auto& h : targets) {
        auto r = configure_git_helper(ctx, h);
        if (r.is_err()) return report(ctx, r);
    }
    return 0;
}

void register_setup_git_commands(AuthCLI& cli) {
    cli.add_command("setup-git", do_setup_git, "Setup git with ghx as a credential helper");
}
