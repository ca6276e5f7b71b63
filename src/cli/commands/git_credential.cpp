#include "../auth_cli.hpp"
#include <auth/git_credential.hpp>

static int do_git_credential(AuthContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return report_error(ctx, "ghx auth git-credential: expected one operation (get, store or erase)",
                            ErrorKind::Validation);
    }

    auto r = run_git_credential(args[0], ctx.registry, ctx.in, ctx.out);
    if (r.is_err()) return report(ctx, r);

    // Nothing to offer for this request; git moves on to the next helper.
    if (args[0] == "get" && !r.value) return 1;
    return 0;
}

void register_git_credential_commands(AuthCLI& cli) {
    cli.add_command("git-credential", do_git_credential, "");
}
