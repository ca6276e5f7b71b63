#include "auth_helpers.hpp"
#include "../flags.hpp"
#include "../prompter.hpp"
#include "../theme.hpp"
#include <auth/account_registry.hpp>
#include <auth/device_flow.hpp>
#include <core/constants.hpp>
#include <core/host.hpp>
#include <core/utils.hpp>
#include <iterator>
#include <istream>
#include <ostream>
#include <fmt/format.h>

static const std::vector<FlagSpec> LOGIN_FLAGS = {
    {"hostname", 'h', true},
    {"scopes", 's', true},
    {"git-protocol", 'p', true},
    {"web", 'w', false},
    {"with-token", 0, false},
    {"clipboard", 'c', false},
    {"insecure-storage", 0, false},
};

static Result<std::string> choose_host(AuthContext& ctx) {
    auto kind = ctx.prompter->select("Where do you use GitHub?", {"GitHub.com", "Other"});
    if (kind.is_err()) return Result<std::string>::From(kind);
    if (kind.value == 0) return Result<std::string>::Ok(GITHUB_COM);

    auto entered = ctx.prompter->input("Hostname:");
    if (entered.is_err()) return entered;
    std::string h = host::normalize(entered.value);
    if (h.empty()) {
        return Result<std::string>::Err(ErrorKind::Validation, "a hostname is required");
    }
    return Result<std::string>::Ok(h);
}

static Result<std::string> choose_protocol(AuthContext& ctx) {
    auto choice = ctx.prompter->select(
        "What is your preferred protocol for Git operations on this host?", {"HTTPS", "SSH"});
    if (choice.is_err()) return Result<std::string>::From(choice);
    return Result<std::string>::Ok(choice.value == 0 ? "https" : "ssh");
}

static int do_login(AuthContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parse_flags(args, LOGIN_FLAGS);
    if (parsed.is_err()) return report(ctx, parsed);
    const ParsedFlags& flags = parsed.value;

    if (flags.has("with-token") && flags.has("web")) {
        return report_error(ctx, "specify only one of `--web` or `--with-token`", ErrorKind::Validation);
    }
    if (flags.has("with-token") && flags.has("scopes")) {
        return report_error(ctx, "specify only one of `--scopes` or `--with-token`", ErrorKind::Validation);
    }

    std::string protocol = to_lower(flags.get_or("git-protocol", ""));
    if (!protocol.empty() && protocol != "https" && protocol != "ssh") {
        return report_error(ctx,
            fmt::format("invalid git protocol \"{}\": expected https or ssh", protocol),
            ErrorKind::Validation);
    }

    bool interactive = ctx.prompter != nullptr && !flags.has("with-token");

    std::string hostname;
    if (auto h = flags.get("hostname")) {
        hostname = host::normalize(*h);
    } else if (interactive && !flags.has("web")) {
        auto chosen = choose_host(ctx);
        if (chosen.is_err()) return report(ctx, chosen);
        hostname = chosen.value;
    } else {
        hostname = host::normalize(ctx.shared.env()("GH_HOST").value_or(GITHUB_COM));
    }

    auto writeable = ctx.registry.check_writeable(hostname);
    if (writeable.is_err()) return report(ctx, writeable);

    bool secure = !flags.has("insecure-storage");

    // ── Token from stdin ────────────────────────────────────

    if (flags.has("with-token")) {
        std::istreambuf_iterator<char> begin(ctx.in), end;
        std::string token(begin, end);
        trim(token);
        if (token.empty()) {
            return report_error(ctx, "no token provided on standard input", ErrorKind::Validation);
        }

        auto user = validate_pasted_token(ctx, hostname, token);
        if (user.is_err()) return report(ctx, user);

        if (protocol.empty()) protocol = ctx.registry.git_protocol(hostname);
        auto r = ctx.registry.login(hostname, user.value, token, protocol, secure);
        if (r.is_err()) return report(ctx, r);
        return 0;
    }

    // ── Interactive / device flow ───────────────────────────

    if (protocol.empty()) {
        if (interactive) {
            auto chosen = choose_protocol(ctx);
            if (chosen.is_err()) return report(ctx, chosen);
            protocol = chosen.value;
        } else {
            protocol = ctx.registry.git_protocol(hostname);
        }
    }

    bool paste = false;
    if (interactive && !flags.has("web")) {
        auto mode = ctx.prompter->select("How would you like to authenticate ghx?",
                                         {"Login with a web browser", "Paste an authentication token"});
        if (mode.is_err()) return report(ctx, mode);
        paste = mode.value == 1;
    }

    std::string token;
    std::string username;

    if (paste) {
        ctx.err << fmt::format("Tip: you can generate a Personal Access Token here {}settings/tokens\n",
                               host::web_url(hostname));
        ctx.err << "The minimum required scopes are 'repo', 'read:org'.\n";

        auto pasted = ctx.prompter->password("Paste your authentication token:");
        if (pasted.is_err()) return report(ctx, pasted);
        token = trimmed(pasted.value);
        if (token.empty()) {
            return report_error(ctx, "token cannot be empty", ErrorKind::Validation);
        }

        auto user = validate_pasted_token(ctx, hostname, token);
        if (user.is_err()) return report(ctx, user);
        username = user.value;
    } else {
        std::vector<std::string> scopes(std::begin(DEFAULT_SCOPES), std::end(DEFAULT_SCOPES));
        scopes = merge_scopes(scopes, flags.list("scopes"));

        DeviceFlow flow(ctx.http, ctx.clock, ctx.sleep);
        auto result = flow.run(hostname, scopes, make_device_flow_ui(ctx, flags.has("clipboard")));
        if (result.is_err()) return report(ctx, result);

        ctx.err << theme::ok("Authentication complete.");
        token = result.value.token;
        username = result.value.username;
    }

    bool setup_git = false;
    if (protocol == "https" && interactive) {
        auto answer = ctx.prompter->confirm("Authenticate Git with your GitHub credentials?", true);
        if (answer.is_err()) return report(ctx, answer);
        setup_git = answer.value;
    }

    auto r = ctx.registry.login(hostname, username, token, protocol, secure);
    if (r.is_err()) return report(ctx, r);

    if (setup_git) {
        auto helper = configure_git_helper(ctx, hostname);
        if (helper.is_err()) return report(ctx, helper);
    }

    ctx.err << theme::ok(fmt::format("Configured git protocol: {}", protocol));
    ctx.err << theme::ok(fmt::format("Logged in as {}", theme::bold(username)));
    return 0;
}

void register_login_commands(AuthCLI& cli) {
    cli.add_command("login", do_login, "Log in to a GitHub account");
}
