#include "auth_helpers.hpp"
#include "../prompter.hpp"
#include "../theme.hpp"
#include <api/api_client.hpp>
#include <core/host.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <ostream>
#include <fmt/format.h>

DeviceFlowUI make_device_flow_ui(AuthContext& ctx, bool copy_code) {
    DeviceFlowUI ui;

    ui.show_code = [&ctx](const DeviceCode& code) {
        ctx.err << theme::warn(fmt::format("First copy your one-time code: {}", theme::bold(code.user_code)));
    };

    if (copy_code) {
        ui.copy_code = [&ctx](const std::string& user_code) -> Result<void> {
            if (!ctx.copy_to_clipboard) {
                return Result<void>::Err("no clipboard available");
            }
            auto r = ctx.copy_to_clipboard(user_code);
            if (r.is_ok()) ctx.err << theme::ok("Copied to clipboard");
            return r;
        };
    }

    ui.open_url = [&ctx](const std::string& url) -> Result<void> {
        if (!ctx.prompter || !ctx.open_browser) {
            ctx.err << fmt::format("Open this URL to continue in your web browser: {}\n", url);
            return Result<void>::Ok();
        }
        auto wait = ctx.prompter->input(
            fmt::format("Press Enter to open {} in your browser...", host::normalize(url)));
        if (wait.is_err()) return Result<void>::From(wait);
        return ctx.open_browser(url);
    };

    ui.warn = [&ctx](const std::string& message) {
        ctx.err << theme::warn(message);
    };
    return ui;
}

Result<std::string> validate_pasted_token(AuthContext& ctx,
                                          const std::string& host,
                                          const std::string& token) {
    ApiClient api(ctx.http);

    if (expect_scopes(token)) {
        auto scopes = api.token_scopes(host, token);
        if (scopes.is_err()) {
            return Result<std::string>::Err(scopes.kind,
                fmt::format("error validating token: {}", scopes.error));
        }
        auto check = check_minimum_scopes(scopes.value);
        if (check.is_err()) {
            return Result<std::string>::Err(ErrorKind::Validation,
                fmt::format("error validating token: {}", check.error));
        }
    }

    auto login = api.current_login(host, token);
    if (login.is_err()) {
        return Result<std::string>::Err(login.kind,
            fmt::format("error retrieving current user: {}", login.error));
    }
    return login;
}

static Result<void> set_helper(AuthContext& ctx, const std::string& url) {
    std::string key = fmt::format("credential.{}.helper", url);

    // An empty first entry resets helpers inherited from other config files.
    int rc = ctx.run_git({"config", "--global", "--replace-all", key, ""});
    if (rc == 0) {
        rc = ctx.run_git({"config", "--global", "--add", key,
                          fmt::format("!{} auth git-credential", ctx.executable)});
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Storage,
            fmt::format("failed to configure git credential helper for {} (git exited {})", url, rc));
    }
    ghx_logf("setup-git: helper set for {}", url);
    return Result<void>::Ok();
}

Result<void> configure_git_helper(AuthContext& ctx, const std::string& hostname) {
    if (!ctx.run_git) {
        return Result<void>::Err("git is not available");
    }

    auto r = set_helper(ctx, "https://" + hostname);
    if (r.is_err()) return r;

    if (host::is_github_com(hostname)) {
        return set_helper(ctx, "https://gist." + hostname);
    }
    return Result<void>::Ok();
}

std::vector<std::string> merge_scopes(const std::vector<std::string>& base,
                                      const std::vector<std::string>& added) {
    std::vector<std::string> out;
    for (const auto* list : {&base, &added}) {
        for (const auto& s : *list) {
            if (!s.empty() && std::find(out.begin(), out.end(), s) == out.end()) {
                out.push_back(s);
            }
        }
    }
    return out;
}
