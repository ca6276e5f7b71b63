#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <iosfwd>
#include <core/types.hpp>
#include <auth/device_flow.hpp>

class SharedConfig;
class AccountRegistry;
class HttpClient;
class Prompter;

// Everything a command touches, injected so tests can run commands against
// in-memory config, fake HTTP and string streams.
struct AuthContext {
    SharedConfig& shared;
    AccountRegistry& registry;
    HttpClient& http;
    std::istream& in;
    std::ostream& out;
    std::ostream& err;

    Prompter* prompter = nullptr;   // null when prompting is unavailable

    std::function<Result<void>(const std::string& text)> copy_to_clipboard;
    std::function<Result<void>(const std::string& url)> open_browser;

    // `git` runner for setup-git; returns the exit code.
    std::function<int(const std::vector<std::string>& args)> run_git;

    // Command git invokes as the credential helper.
    std::string executable = "ghx";

    SteadyClock clock = std::chrono::steady_clock::now;
    Sleeper sleep;
};

// `ghx auth <command> [flags]` dispatcher.
class AuthCLI {
public:
    using CommandHandler = std::function<int(AuthContext&, const std::vector<std::string>&)>;

    explicit AuthCLI(AuthContext& ctx);

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);

    // Exit status of the command: 0 success, 1 failure, 2 cancelled.
    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help(std::ostream& os) const;

private:
    AuthContext& ctx_;
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

// Print the error of a failed result and map it to an exit status.
int report_error(AuthContext& ctx, const std::string& error, ErrorKind kind);

template <typename T>
int report(AuthContext& ctx, const Result<T>& r) {
    return report_error(ctx, r.error, r.kind);
}

// Command registration, one per file under commands/.
void register_login_commands(AuthCLI& cli);
void register_logout_commands(AuthCLI& cli);
void register_switch_commands(AuthCLI& cli);
void register_status_commands(AuthCLI& cli);
void register_token_commands(AuthCLI& cli);
void register_refresh_commands(AuthCLI& cli);
void register_git_credential_commands(AuthCLI& cli);
void register_setup_git_commands(AuthCLI& cli);
