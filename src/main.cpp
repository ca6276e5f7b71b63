#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <filesystem>
#include "api/http_client.hpp"
#include "auth/account_registry.hpp"
#include "auth/config_credential_store.hpp"
#include "auth/keyring_store.hpp"
#include "cli/auth_cli.hpp"
#include "cli/desktop.hpp"
#include "cli/prompter.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "platform/process.hpp"
#include "platform/terminal.hpp"

void print_usage(std::ostream& os) {
    os << "Work seamlessly with GitHub accounts from the command line.\n\n";
    os << theme::bold("USAGE") << "\n";
    os << "  ghx auth <command> [flags]\n\n";
    os << theme::dim("  ghx --version        Show version\n"
                     "  ghx --help           Show this help") << "\n\n";
}

// argv[0] as git should invoke it from any directory.
static std::string helper_executable(const char* argv0) {
    std::string self = argv0 ? argv0 : "ghx";
    if (self.find('/') == std::string::npos && self.find('\\') == std::string::npos) {
        return self;
    }
    std::error_code ec;
    auto abs = std::filesystem::absolute(self, ec);
    return ec ? self : abs.string();
}

int main(int argc, char** argv) {
    theme::colors_enabled() = platform::stderr_is_terminal() && !process_env("NO_COLOR");

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "help") {
        print_usage(std::cout);
        return args.empty() ? 1 : 0;
    }
    if (args[0] == "--version") {
        std::cout << "ghx version " << GHX_VERSION << "\n";
        return 0;
    }
    if (args[0] != "auth") {
        std::cerr << theme::fail("unknown command \"" + args[0] + "\" for \"ghx\"");
        print_usage(std::cerr);
        return 1;
    }

    try {
        SharedConfig shared(std::make_unique<FileConfigStore>());
        auto loaded = shared.load();
        if (loaded.is_err()) {
            std::cerr << theme::fail(loaded.error);
            return 1;
        }

        auto secure = std::make_shared<KeyringCredentialStore>(make_system_keyring());
        auto insecure = std::make_shared<ConfigCredentialStore>(shared);
        AccountRegistry registry(shared, secure, insecure);
        CurlHttpClient http;

        std::unique_ptr<Prompter> prompter;
        if (can_prompt(shared.config(), platform::stdin_is_terminal(), platform::stdout_is_terminal())) {
            prompter = std::make_unique<TerminalPrompter>(std::cin, std::cerr);
        }

        AuthContext ctx{shared, registry, http, std::cin, std::cout, std::cerr};
        ctx.prompter = prompter.get();
        ctx.copy_to_clipboard = copy_to_clipboard;
        ctx.open_browser = [&shared](const std::string& url) {
            return open_in_browser(url, shared.config());
        };
        ctx.run_git = [](const std::vector<std::string>& git_args) {
            return platform::run("git", git_args);
        };
        ctx.executable = helper_executable(argv[0]);

        AuthCLI cli(ctx);
        if (args.size() < 2 || args[1] == "--help" || args[1] == "help") {
            cli.print_help(std::cout);
            return args.size() < 2 ? 1 : 0;
        }

        std::vector<std::string> rest(args.begin() + 2, args.end());
        return cli.execute_command(args[1], rest);
    } catch (const std::exception& e) {
        ghx_logf("uncaught exception: {}", e.what());
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
