#include <gtest/gtest.h>
#include <auth/config_credential_store.hpp>
#include <auth/env_token.hpp>
#include <auth/keyring_store.hpp>
#include <core/config_store.hpp>
#include "fakes.hpp"

using namespace std::chrono;

// ── Keychain backend ────────────────────────────────────────

class KeyringStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeKeyring> keyring = std::make_shared<FakeKeyring>();

    void TearDown() override {
        // Let abandoned workers finish.
        keyring->release();
    }
};

TEST_F(KeyringStoreTest, AddressesServiceByHost) {
    KeyringCredentialStore store(keyring);
    ASSERT_TRUE(store.store("github.com", "monalisa", "gho_aaa").is_ok());
    ASSERT_TRUE(store.store("github.com", CredentialStore::ACTIVE_SLOT, "gho_aaa").is_ok());

    EXPECT_EQ(keyring->secret("gh:github.com", "monalisa"), "gho_aaa");
    EXPECT_TRUE(keyring->has("gh:github.com", ""));
    EXPECT_EQ(keyring_service("ghe.example.com"), "gh:ghe.example.com");
}

TEST_F(KeyringStoreTest, SourceNamesPlaintextBackend) {
    EXPECT_STREQ(KeyringCredentialStore(keyring).source_name(), "keyring");

    keyring->on_disk = true;
    EXPECT_STREQ(KeyringCredentialStore(keyring).source_name(), "keyring (fake)");
}

TEST_F(KeyringStoreTest, MissingEntryIsEmptyNotError) {
    KeyringCredentialStore store(keyring);
    auto r = store.get("github.com", "nobody");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.has_value());

    EXPECT_TRUE(store.remove("github.com", "nobody").is_ok());
}

TEST_F(KeyringStoreTest, RoundTrip) {
    KeyringCredentialStore store(keyring);
    store.store("github.com", "monalisa", "gho_aaa");
    auto r = store.get("github.com", "monalisa");
    ASSERT_TRUE(r.value.has_value());
    EXPECT_EQ(*r.value, "gho_aaa");

    ASSERT_TRUE(store.remove("github.com", "monalisa").is_ok());
    EXPECT_FALSE(store.get("github.com", "monalisa").value.has_value());
}

TEST_F(KeyringStoreTest, HungKeychainTimesOut) {
    KeyringCredentialStore store(keyring, milliseconds(50));
    keyring->block();

    auto start = steady_clock::now();
    auto r = store.get("github.com", "monalisa");
    auto elapsed = steady_clock::now() - start;

    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Timeout);
    EXPECT_LT(elapsed, seconds(2));

    EXPECT_EQ(store.store("github.com", "monalisa", "x").kind, ErrorKind::Timeout);
    EXPECT_EQ(store.remove("github.com", "monalisa").kind, ErrorKind::Timeout);
}

TEST_F(KeyringStoreTest, BackendErrorPropagates) {
    KeyringCredentialStore store(keyring);
    keyring->fail_with = "keychain locked";
    auto r = store.get("github.com", "monalisa");
    EXPECT_EQ(r.kind, ErrorKind::Storage);
    EXPECT_EQ(r.error, "keychain locked");
}

// ── Config backend ──────────────────────────────────────────

class ConfigStoreBackendTest : public ::testing::Test {
protected:
    SharedConfig shared{std::make_unique<MemoryConfigStore>(), empty_env()};
    ConfigCredentialStore store{shared};

    void SetUp() override {
        HostEntry h;
        h.active_user = "monalisa";
        AccountEntry u;
        u.user = "monalisa";
        u.secure_storage = false;
        h.users.push_back(u);
        shared.config().hosts().hosts["github.com"] = h;
    }
};

TEST_F(ConfigStoreBackendTest, SlotsMapToHostAndAccount) {
    ASSERT_TRUE(store.store("github.com", "monalisa", "gho_user").is_ok());
    ASSERT_TRUE(store.store("github.com", CredentialStore::ACTIVE_SLOT, "gho_active").is_ok());

    const HostEntry* h = shared.config().hosts().find("github.com");
    EXPECT_EQ(h->oauth_token, "gho_active");
    EXPECT_EQ(h->users[0].oauth_token, "gho_user");

    EXPECT_EQ(*store.get("github.com", "monalisa").value, "gho_user");
    EXPECT_EQ(*store.get("github.com", "").value, "gho_active");
    EXPECT_STREQ(store.source_name(), "config");
}

TEST_F(ConfigStoreBackendTest, UnknownAccountCannotStore) {
    auto r = store.store("github.com", "hubot", "gho_x");
    EXPECT_EQ(r.kind, ErrorKind::Storage);
    EXPECT_FALSE(store.get("github.com", "hubot").value.has_value());
    EXPECT_FALSE(store.get("ghe.example.com", "").value.has_value());
}

TEST_F(ConfigStoreBackendTest, RemoveClearsSlot) {
    store.store("github.com", "monalisa", "gho_user");
    store.store("github.com", "", "gho_active");

    EXPECT_TRUE(store.remove("github.com", "").is_ok());
    EXPECT_TRUE(store.remove("github.com", "monalisa").is_ok());
    EXPECT_TRUE(store.remove("ghe.example.com", "monalisa").is_ok());

    EXPECT_FALSE(store.get("github.com", "").value.has_value());
    EXPECT_FALSE(store.get("github.com", "monalisa").value.has_value());
}

// ── Environment tokens ──────────────────────────────────────

TEST(EnvTokenTest, CloudPrefersGhToken) {
    auto env = env_from({{"GH_TOKEN", "a"}, {"GITHUB_TOKEN", "b"}});
    auto t = token_from_env("github.com", env);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->token, "a");
    EXPECT_EQ(t->source, "GH_TOKEN");

    auto fallback = token_from_env("github.com", env_from({{"GITHUB_TOKEN", "b"}}));
    EXPECT_EQ(fallback->source, "GITHUB_TOKEN");
}

TEST(EnvTokenTest, EnterpriseIgnoresCloudVariables) {
    auto env = env_from({{"GH_TOKEN", "a"}});
    EXPECT_FALSE(token_from_env("ghe.example.com", env).has_value());

    auto ent = env_from({{"GH_ENTERPRISE_TOKEN", "c"}, {"GITHUB_ENTERPRISE_TOKEN", "d"}});
    EXPECT_EQ(token_from_env("ghe.example.com", ent)->source, "GH_ENTERPRISE_TOKEN");
    EXPECT_FALSE(token_from_env("github.com", ent).has_value());
}

TEST(EnvTokenTest, EmptyValueIsUnset) {
    EXPECT_FALSE(token_from_env("github.com", env_from({{"GH_TOKEN", ""}})).has_value());
}

TEST(EnvTokenTest, TokenVariablesAreNotWriteable) {
    EXPECT_FALSE(token_source_writeable("GH_TOKEN"));
    EXPECT_FALSE(token_source_writeable("GITHUB_ENTERPRISE_TOKEN"));
    EXPECT_TRUE(token_source_writeable("keyring"));
    EXPECT_TRUE(token_source_writeable("config"));
}
