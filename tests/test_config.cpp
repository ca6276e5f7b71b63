#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/config_store.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "fakes.hpp"

namespace fs = std::filesystem;

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "ghx_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& name, const std::string& content) {
        std::ofstream(test_dir / name) << content;
    }

    std::string read_file(const std::string& name) {
        std::ifstream f(test_dir / name);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

TEST_F(ConfigFileTest, MissingFilesLoadEmpty) {
    FileConfigStore store(test_dir);
    Config config(empty_env());
    ASSERT_TRUE(store.load(config).is_ok());
    EXPECT_TRUE(config.hosts().hosts.empty());
    EXPECT_EQ(config.git_protocol("github.com"), "https");
    EXPECT_TRUE(config.prompt_enabled());
}

TEST_F(ConfigFileTest, SaveAndReload) {
    FileConfigStore store(test_dir);
    Config config(empty_env());
    ASSERT_TRUE(config.set("", "git_protocol", "ssh").is_ok());

    HostEntry h;
    h.active_user = "hubot";
    h.git_protocol = "https";
    h.oauth_token = "gho_active";
    AccountEntry mona{"monalisa", "ssh", true, std::nullopt};
    AccountEntry hubot{"hubot", "https", false, std::string("gho_active")};
    h.users = {mona, hubot};
    config.hosts().hosts["github.com"] = h;

    ASSERT_TRUE(store.save(config).is_ok());

    auto perms = fs::status(test_dir / "hosts.yml").permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);

    Config loaded(empty_env());
    ASSERT_TRUE(store.load(loaded).is_ok());
    EXPECT_EQ(loaded.get_or_default("", "git_protocol"), "ssh");

    const HostEntry* got = loaded.hosts().find("github.com");
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->active_user, "hubot");
    EXPECT_EQ(got->oauth_token, "gho_active");
    ASSERT_EQ(got->usernames(), (std::vector<std::string>{"monalisa", "hubot"}));
    EXPECT_TRUE(got->users[0].secure_storage);
    EXPECT_FALSE(got->users[0].oauth_token.has_value());
    EXPECT_FALSE(got->users[1].secure_storage);
    EXPECT_EQ(got->users[1].oauth_token, "gho_active");
}

TEST_F(ConfigFileTest, SaveReplacesReadableFilesWithOwnerOnlyOnes) {
    write_file("hosts.yml", "{}\n");
    write_file("hosts.yml.tmp", "stale");
    fs::permissions(test_dir / "hosts.yml", fs::perms::all, fs::perm_options::replace);
    fs::permissions(test_dir / "hosts.yml.tmp", fs::perms::all, fs::perm_options::replace);

    FileConfigStore store(test_dir);
    Config config(empty_env());
    HostEntry h;
    h.active_user = "hubot";
    h.oauth_token = "gho_plain";
    h.users = {AccountEntry{"hubot", "https", false, std::string("gho_plain")}};
    config.hosts().hosts["github.com"] = h;
    ASSERT_TRUE(store.save(config).is_ok());

    auto perms = fs::status(test_dir / "hosts.yml").permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
    EXPECT_FALSE(fs::exists(test_dir / "hosts.yml.tmp"));
    EXPECT_NE(read_file("hosts.yml").find("gho_plain"), std::string::npos);
}

TEST_F(ConfigFileTest, PrivateFileWriteIsOwnerOnly) {
    fs::path path = test_dir / "keyring";
    ASSERT_EQ(platform::write_private_file(path, "gh:github.com\tmonalisa=gho_a\n"), std::error_code());
    EXPECT_EQ(fs::status(path).permissions() & (fs::perms::group_all | fs::perms::others_all),
              fs::perms::none);

    ASSERT_EQ(platform::write_private_file(path, "gh:github.com\thubot=gho_b\n"), std::error_code());
    EXPECT_EQ(read_file("keyring"), "gh:github.com\thubot=gho_b\n");
    EXPECT_FALSE(fs::exists(test_dir / "keyring.tmp"));
}

TEST_F(ConfigFileTest, PrivateFileWriteFailureKeepsOldContent) {
    write_file("keyring", "old\n");
    fs::path missing_dir = test_dir / "missing" / "keyring";
    EXPECT_NE(platform::write_private_file(missing_dir, "new\n"), std::error_code());
    EXPECT_EQ(read_file("keyring"), "old\n");
}

TEST_F(ConfigFileTest, SecureTokensNeverWritten) {
    FileConfigStore store(test_dir);
    Config config(empty_env());
    HostEntry h;
    h.active_user = "monalisa";
    h.users = {AccountEntry{"monalisa", "https", true, std::nullopt}};
    config.hosts().hosts["github.com"] = h;
    ASSERT_TRUE(store.save(config).is_ok());

    EXPECT_EQ(read_file("hosts.yml").find("oauth_token"), std::string::npos);
}

TEST_F(ConfigFileTest, LegacySingleAccountLayout) {
    write_file("hosts.yml",
               "github.com:\n"
               "  user: monalisa\n"
               "  oauth_token: gho_old\n"
               "  git_protocol: ssh\n");

    FileConfigStore store(test_dir);
    Config config(empty_env());
    ASSERT_TRUE(store.load(config).is_ok());

    const HostEntry* h = config.hosts().find("github.com");
    ASSERT_NE(h, nullptr);
    EXPECT_EQ(h->active_user, "monalisa");
    ASSERT_EQ(h->users.size(), 1u);
    EXPECT_FALSE(h->users[0].secure_storage);
    EXPECT_EQ(h->users[0].oauth_token, "gho_old");
    EXPECT_EQ(h->users[0].git_protocol, "ssh");
}

TEST_F(ConfigFileTest, MalformedHostsFileIsStorageError) {
    write_file("hosts.yml", "github.com: [unterminated\n");
    FileConfigStore store(test_dir);
    Config config(empty_env());
    auto r = store.load(config);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Storage);
}

TEST(HostsYamlTest, UnlistedActiveUserMigrated) {
    auto r = hosts_from_yaml(
        "github.com:\n"
        "  user: ghost\n"
        "  users:\n"
        "    monalisa:\n"
        "      secure_storage: true\n");
    ASSERT_TRUE(r.is_ok());
    const HostEntry* h = r.value.find("github.com");
    EXPECT_EQ(h->active_user, "ghost");
    EXPECT_TRUE(h->has_user("ghost"));
    EXPECT_TRUE(h->has_user("monalisa"));
}

TEST(HostsYamlTest, HostKeysNormalized) {
    auto r = hosts_from_yaml(
        "GitHub.com:\n"
        "  user: monalisa\n"
        "  users:\n"
        "    monalisa:\n"
        "      secure_storage: true\n"
        "https://GHE.Example.com/:\n"
        "  user: admin\n"
        "  users:\n"
        "    admin:\n"
        "      secure_storage: true\n");
    ASSERT_TRUE(r.is_ok());
    ASSERT_NE(r.value.find("github.com"), nullptr);
    EXPECT_EQ(r.value.find("github.com")->active_user, "monalisa");
    ASSERT_NE(r.value.find("ghe.example.com"), nullptr);
    EXPECT_EQ(r.value.hosts.size(), 2u);
}

TEST(ConfigTest, EnvironmentOverridesSettings) {
    Config config(env_from({{"GH_GIT_PROTOCOL", "ssh"}, {"GH_PROMPT", "disabled"}}));
    config.set("", "git_protocol", "https");
    EXPECT_EQ(config.git_protocol("github.com"), "ssh");
    EXPECT_FALSE(config.prompt_enabled());
}

TEST(ConfigTest, HostProtocolOverridesGlobal) {
    Config config(empty_env());
    config.set("", "git_protocol", "https");
    ASSERT_TRUE(config.set("ghe.example.com", "git_protocol", "ssh").is_ok());
    EXPECT_EQ(config.git_protocol("ghe.example.com"), "ssh");
    EXPECT_EQ(config.git_protocol("github.com"), "https");
}

TEST(ConfigTest, SetValidates) {
    Config config(empty_env());
    EXPECT_EQ(config.set("", "nope", "x").kind, ErrorKind::Validation);
    EXPECT_EQ(config.set("", "git_protocol", "ftp").kind, ErrorKind::Validation);
    EXPECT_EQ(config.set("github.com", "editor", "vim").kind, ErrorKind::Validation);
    EXPECT_TRUE(config.set("", "editor", "vim").is_ok());
}
