#include "../auth_cli.hpp"
#include "../flags.hpp"
#include <auth/account_registry.hpp>
#include <core/host.hpp>
#include <ostream>
#include <fmt/format.h>

static const std::vector<FlagSpec> TOKEN_FLAGS = {
    {"hostname", 'h', true},
    {"user", 'u', true},
};

static int do_token(AuthContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parse_flags(args, TOKEN_FLAGS);
    if (parsed.is_err()) return report(ctx, parsed);
    const ParsedFlags& flags = parsed.value;

    std::string hostname = flags.has("hostname")
        ? host::normalize(*flags.get("hostname"))
        : ctx.registry.default_host();

    Result<std::optional<AuthToken>> token = Result<std::optional<AuthToken>>::Ok(std::nullopt);
    std::string missing;
    if (auto user = flags.get("user")) {
        token = ctx.registry.token_for_user(hostname, *user);
        missing = fmt::format("no oauth token found for {} account {}", hostname, *user);
    } else {
        token = ctx.registry.active_token(hostname);
        missing = fmt::format("no oauth token found for {}", hostname);
    }

    if (token.is_err()) return report(ctx, token);
    if (!token.value || token.value->token.empty()) {
        return report_error(ctx, missing, ErrorKind::NotLoggedIn);
    }

    ctx.out << token.value->token << "\n";
    return 0;
}

void register_token_commands(AuthCLI& cli) {
    cli.add_command("token", do_token, "Print the authentication token ghx uses for a hostname and account");
}
