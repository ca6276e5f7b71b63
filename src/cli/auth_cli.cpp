#include "auth_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <ostream>
#include <fmt/format.h>

AuthCLI::AuthCLI(AuthContext& ctx) : ctx_(ctx) {
    register_login_commands(*this);
    register_logout_commands(*this);
    register_refresh_commands(*this);
    register_setup_git_commands(*this);
    register_status_commands(*this);
    register_switch_commands(*this);
    register_token_commands(*this);
    register_git_credential_commands(*this);
}

void AuthCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {handler, help};
}

int AuthCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        ctx_.err << theme::fail(fmt::format("unknown command \"{}\" for \"ghx auth\"", command));
        ctx_.err << theme::step("Run 'ghx auth --help' for available commands.");
        return 1;
    }

    ghx_logf("auth {}: {} argument(s)", command, args.size());
    return it->second.first(ctx_, args);
}

void AuthCLI::print_help(std::ostream& os) const {
    os << "Authenticate ghx and git with GitHub\n\n";
    os << theme::bold("USAGE") << "\n  ghx auth <command> [flags]\n\n";
    os << theme::bold("COMMANDS") << "\n";
    for (const auto& [name, entry] : commands_) {
        if (entry.second.empty()) continue;     // hidden
        os << fmt::format("  {:<16}{}\n", name + ":", entry.second);
    }
    os << "\n";
}

int report_error(AuthContext& ctx, const std::string& error, ErrorKind kind) {
    if (kind == ErrorKind::Cancelled) {
        ghx_logf("cancelled: {}", error);
        return 2;
    }
    ghx_logf("{} error: {}", error_kind_name(kind), error);
    ctx.err << theme::fail(error);
    return 1;
}
