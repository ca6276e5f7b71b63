#include <gtest/gtest.h>
#include <auth/account_registry.hpp>
#include <auth/config_credential_store.hpp>
#include <auth/keyring_store.hpp>
#include <cli/auth_cli.hpp>
#include <cli/flags.hpp>
#include <cli/theme.hpp>
#include <core/config_store.hpp>
#include <sstream>
#include "fakes.hpp"

class AuthCommandTest : public ::testing::Test {
protected:
    std::map<std::string, std::string> env_vars;
    std::shared_ptr<FakeKeyring> keyring = std::make_shared<FakeKeyring>();
    std::unique_ptr<SharedConfig> shared;
    std::unique_ptr<AccountRegistry> registry;
    FakeHttpClient http;
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    std::vector<std::vector<std::string>> git_calls;
    std::unique_ptr<AuthContext> ctx;

    void SetUp() override {
        theme::colors_enabled() = false;
        shared = std::make_unique<SharedConfig>(std::make_unique<MemoryConfigStore>(),
            [this](const std::string& name) {
                auto it = env_vars.find(name);
                if (it == env_vars.end()) return std::optional<std::string>();
                return std::optional<std::string>(it->second);
            });
        registry = std::make_unique<AccountRegistry>(
            *shared,
            std::make_shared<KeyringCredentialStore>(keyring),
            std::make_shared<ConfigCredentialStore>(*shared));

        ctx.reset(new AuthContext{*shared, *registry, http, in, out, err});
        ctx->run_git = [this](const std::vector<std::string>& args) {
            git_calls.push_back(args);
            return 0;
        };
        ctx->sleep = [](std::chrono::seconds) {};
    }

    int run(const std::string& command, const std::vector<std::string>& args,
            const std::string& input = "") {
        in.str(input);
        in.clear();
        out.str("");
        err.str("");
        AuthCLI cli(*ctx);
        return cli.execute_command(command, args);
    }

    void login(const std::string& host, const std::string& user, const std::string& token) {
        ASSERT_TRUE(registry->login(host, user, token, "https", true).is_ok());
    }
};

// ── login ───────────────────────────────────────────────────

TEST_F(AuthCommandTest, LoginWithTokenFromStdin) {
    http.route("api.github.com/graphql", HttpResponse{200, {}, viewer_body("monalisa")});
    http.route("api.github.com/", scopes_response("repo, read:org, gist"));

    EXPECT_EQ(run("login", {"--with-token"}, "gho_pasted\n"), 0) << err.str();
    EXPECT_EQ(registry->active_user("github.com"), "monalisa");
    EXPECT_EQ(keyring->secret("gh:github.com", "monalisa"), "gho_pasted");
}

TEST_F(AuthCommandTest, LoginWithTokenInsecureStorage) {
    http.route("/graphql", HttpResponse{200, {}, viewer_body("admin")});
    http.route("/api/v3/", scopes_response(""));

    EXPECT_EQ(run("login", {"-h", "ghe.example.com", "--with-token", "--insecure-storage"}, "gho_e"), 0)
        << err.str();
    EXPECT_FALSE(registry->secure_storage("ghe.example.com", "admin"));
    EXPECT_TRUE(keyring->entries.empty());
}

TEST_F(AuthCommandTest, LoginRejectsInsufficientScopes) {
    http.route("api.github.com/graphql", HttpResponse{200, {}, viewer_body("monalisa")});
    http.route("api.github.com/", scopes_response("gist"));

    EXPECT_EQ(run("login", {"--with-token"}, "ghp_weak"), 1);
    EXPECT_NE(err.str().find("missing required scope(s)"), std::string::npos);
    EXPECT_TRUE(registry->hosts().empty());
}

TEST_F(AuthCommandTest, LoginRejectsEmptyToken) {
    EXPECT_EQ(run("login", {"--with-token"}, "  \n"), 1);
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(AuthCommandTest, LoginConflictingFlags) {
    EXPECT_EQ(run("login", {"--with-token", "--web"}), 1);
    EXPECT_NE(err.str().find("--web"), std::string::npos);
    EXPECT_EQ(run("login", {"--with-token", "-s", "repo"}), 1);
    EXPECT_EQ(run("login", {"-p", "ftp"}), 1);
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(AuthCommandTest, LoginRefusedUnderEnvironmentToken) {
    env_vars["GH_TOKEN"] = "ghp_env";
    EXPECT_EQ(run("login", {"--with-token"}, "gho_x"), 1);
    EXPECT_NE(err.str().find("GH_TOKEN"), std::string::npos);
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(AuthCommandTest, LoginDeviceFlowWhenNotInteractive) {
    http.route_json("/login/device/code",
        "{\"device_code\":\"dc\",\"user_code\":\"ABCD-1234\","
        "\"verification_uri\":\"https://github.com/login/device\",\"expires_in\":900,\"interval\":5}");
    http.route_json("/login/oauth/access_token", "{\"access_token\":\"gho_flow\"}");
    http.route("/graphql", HttpResponse{200, {}, viewer_body("monalisa")});

    EXPECT_EQ(run("login", {"-s", "workflow", "-p", "ssh"}), 0) << err.str();
    EXPECT_NE(err.str().find("ABCD-1234"), std::string::npos);
    EXPECT_NE(err.str().find("https://github.com/login/device"), std::string::npos);
    EXPECT_NE(http.requests.front().body.find("gist%20workflow"), std::string::npos);
    EXPECT_EQ(registry->git_protocol("github.com"), "ssh");
    EXPECT_EQ(keyring->secret("gh:github.com", ""), "gho_flow");
}

TEST_F(AuthCommandTest, LoginClipboardReportsCopyOnlyOnSuccess) {
    http.route_json("/login/device/code",
        "{\"device_code\":\"dc\",\"user_code\":\"ABCD-1234\","
        "\"verification_uri\":\"https://github.com/login/device\",\"expires_in\":900,\"interval\":5}");
    http.route_json("/login/oauth/access_token", "{\"access_token\":\"gho_flow\"}");
    http.route("/graphql", HttpResponse{200, {}, viewer_body("monalisa")});

    std::string copied;
    ctx->copy_to_clipboard = [&](const std::string& text) {
        copied = text;
        return Result<void>::Ok();
    };
    EXPECT_EQ(run("login", {"-c"}), 0) << err.str();
    EXPECT_EQ(copied, "ABCD-1234");
    EXPECT_NE(err.str().find("First copy your one-time code: ABCD-1234"), std::string::npos);
    EXPECT_NE(err.str().find("Copied to clipboard"), std::string::npos);

    ctx->copy_to_clipboard = [](const std::string&) { return Result<void>::Err("xclip not found"); };
    EXPECT_EQ(run("login", {"-c"}), 0) << err.str();
    EXPECT_EQ(err.str().find("Copied to clipboard"), std::string::npos);
    EXPECT_NE(err.str().find("failed to copy to clipboard: xclip not found"), std::string::npos);

    ctx->copy_to_clipboard = nullptr;
    EXPECT_EQ(run("login", {"-c"}), 0) << err.str();
    EXPECT_EQ(err.str().find("Copied to clipboard"), std::string::npos);
    EXPECT_NE(err.str().find("failed to copy to clipboard"), std::string::npos);
}

// ── logout / switch ─────────────────────────────────────────

TEST_F(AuthCommandTest, LogoutPromotesAndReports) {
    login("github.com", "monalisa", "gho_a");
    login("github.com", "hubot", "gho_b");

    EXPECT_EQ(run("logout", {"-u", "hubot"}), 0) << err.str();
    EXPECT_NE(err.str().find("Logged out of github.com account hubot"), std::string::npos);
    EXPECT_NE(err.str().find("Switched active account for github.com to monalisa"), std::string::npos);
}

TEST_F(AuthCommandTest, LogoutAmbiguousWithoutPrompt) {
    login("github.com", "monalisa", "gho_a");
    login("github.com", "hubot", "gho_b");

    EXPECT_EQ(run("logout", {}), 1);
    EXPECT_NE(err.str().find("--hostname"), std::string::npos);
    EXPECT_EQ(registry->users_for_host("github.com").size(), 2u);
}

TEST_F(AuthCommandTest, SwitchToggles) {
    login("github.com", "monalisa", "gho_a");
    login("github.com", "hubot", "gho_b");

    EXPECT_EQ(run("switch", {}), 0) << err.str();
    EXPECT_EQ(registry->active_user("github.com"), "monalisa");
    EXPECT_EQ(run("switch", {}), 0);
    EXPECT_EQ(registry->active_user("github.com"), "hubot");
}

TEST_F(AuthCommandTest, SwitchWithSingleAccount) {
    login("github.com", "monalisa", "gho_a");
    EXPECT_EQ(run("switch", {}), 0);
    EXPECT_NE(err.str().find("nothing to switch to"), std::string::npos);
}

TEST_F(AuthCommandTest, SwitchUnknownUser) {
    login("github.com", "monalisa", "gho_a");
    EXPECT_EQ(run("switch", {"-h", "github.com", "-u", "nobody"}), 1);
    EXPECT_EQ(registry->active_user("github.com"), "monalisa");
}

// ── token / status ──────────────────────────────────────────

TEST_F(AuthCommandTest, TokenPrintsActiveOrPerUser) {
    login("github.com", "monalisa", "gho_a");
    login("github.com", "hubot", "gho_b");

    EXPECT_EQ(run("token", {}), 0);
    EXPECT_EQ(out.str(), "gho_b\n");

    EXPECT_EQ(run("token", {"-u", "monalisa"}), 0);
    EXPECT_EQ(out.str(), "gho_a\n");

    EXPECT_EQ(run("token", {"-h", "ghe.example.com"}), 1);
    EXPECT_NE(err.str().find("no oauth token found for ghe.example.com"), std::string::npos);
}

TEST_F(AuthCommandTest, StatusListsAccounts) {
    login("github.com", "monalisa", "gho_aaaa");
    login("github.com", "hubot", "gho_bbbb");
    http.route("api.github.com/", scopes_response("repo, read:org"));

    EXPECT_EQ(run("status", {}), 0) << out.str();
    std::string s = out.str();
    EXPECT_NE(s.find("Logged in to github.com account hubot (keyring)"), std::string::npos);
    EXPECT_NE(s.find("Logged in to github.com account monalisa (keyring)"), std::string::npos);
    EXPECT_NE(s.find("Token: gho_****"), std::string::npos);
    EXPECT_NE(s.find("Token scopes: 'repo', 'read:org'"), std::string::npos);
    EXPECT_LT(s.find("hubot"), s.find("monalisa"));
    EXPECT_EQ(s.find("gho_aaaa"), std::string::npos);
}

TEST_F(AuthCommandTest, StatusFailsOnInvalidToken) {
    login("github.com", "monalisa", "gho_aaaa");
    http.route("api.github.com/", scopes_response("", 401));

    EXPECT_EQ(run("status", {"--show-token"}), 1);
    EXPECT_NE(out.str().find("The token in keyring is invalid."), std::string::npos);
}

TEST_F(AuthCommandTest, StatusNotLoggedIn) {
    EXPECT_EQ(run("status", {}), 1);
    EXPECT_NE(err.str().find("not logged into any GitHub hosts"), std::string::npos);
}

// ── setup-git / git-credential ──────────────────────────────

TEST_F(AuthCommandTest, SetupGitConfiguresHelper) {
    login("github.com", "monalisa", "gho_a");
    ctx->executable = "/usr/local/bin/ghx";

    EXPECT_EQ(run("setup-git", {}), 0) << err.str();
    ASSERT_EQ(git_calls.size(), 4u);
    EXPECT_EQ(git_calls[0],
              (std::vector<std::string>{"config", "--global", "--replace-all",
                                        "credential.https://github.com.helper", ""}));
    EXPECT_EQ(git_calls[1].back(), "!/usr/local/bin/ghx auth git-credential");
    EXPECT_EQ(git_calls[2][3], "credential.https://gist.github.com.helper");
}

TEST_F(AuthCommandTest, SetupGitForceNeedsHostname) {
    EXPECT_EQ(run("setup-git", {"--force"}), 1);
    EXPECT_EQ(run("setup-git", {"-h", "ghe.example.com"}), 1);
    EXPECT_TRUE(git_calls.empty());

    EXPECT_EQ(run("setup-git", {"-h", "ghe.example.com", "-f"}), 0);
    EXPECT_EQ(git_calls.size(), 2u);
}

TEST_F(AuthCommandTest, GitCredentialCommand) {
    login("github.com", "monalisa", "gho_a");
    EXPECT_EQ(run("git-credential", {"get"}, "protocol=https\nhost=github.com\n\n"), 0);
    EXPECT_NE(out.str().find("password=gho_a"), std::string::npos);

    EXPECT_EQ(run("git-credential", {"get"}, "protocol=https\nhost=example.org\n\n"), 1);
    EXPECT_EQ(out.str(), "");
}

TEST_F(AuthCommandTest, UnknownCommand) {
    EXPECT_EQ(run("whoami", {}), 1);
    EXPECT_NE(err.str().find("unknown command"), std::string::npos);
}

// ── flag parsing ────────────────────────────────────────────

TEST(FlagsTest, LongShortAndInlineForms) {
    std::vector<FlagSpec> specs = {{"hostname", 'h', true}, {"scopes", 's', true}, {"web", 'w', false}};
    auto r = parse_flags({"-h", "ghe.io", "--scopes=repo,gist", "-s", "workflow", "-w", "extra"}, specs);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.get("hostname"), "ghe.io");
    EXPECT_EQ(r.value.list("scopes"), (std::vector<std::string>{"repo", "gist", "workflow"}));
    EXPECT_TRUE(r.value.has("web"));
    EXPECT_EQ(r.value.positional, std::vector<std::string>{"extra"});
}

TEST(FlagsTest, Errors) {
    std::vector<FlagSpec> specs = {{"hostname", 'h', true}, {"web", 'w', false}};
    EXPECT_EQ(parse_flags({"--nope"}, specs).kind, ErrorKind::Validation);
    EXPECT_EQ(parse_flags({"-h"}, specs).kind, ErrorKind::Validation);
    EXPECT_EQ(parse_flags({"--web=yes"}, specs).kind, ErrorKind::Validation);
}
