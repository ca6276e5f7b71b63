#include <gtest/gtest.h>
#include <api/api_client.hpp>
#include "fakes.hpp"

TEST(MaskTokenTest, KeepsPrefix) {
    EXPECT_EQ(mask_token("gho_abc123"), "gho_******");
    EXPECT_EQ(mask_token("github_pat_11AB_xyz"), "github_pat_11AB_***");
    EXPECT_EQ(mask_token("deadbeef"), "********");
}

TEST(ExpectScopesTest, ClassicAndOauthTokensOnly) {
    EXPECT_TRUE(expect_scopes("ghp_abc"));
    EXPECT_TRUE(expect_scopes("gho_abc"));
    EXPECT_FALSE(expect_scopes("github_pat_abc"));
    EXPECT_FALSE(expect_scopes("ghs_abc"));
    EXPECT_FALSE(expect_scopes("0123456789abcdef"));
}

TEST(MinimumScopesTest, Accepted) {
    EXPECT_TRUE(check_minimum_scopes("repo, read:org").is_ok());
    EXPECT_TRUE(check_minimum_scopes("admin:org, repo, gist").is_ok());
    EXPECT_TRUE(check_minimum_scopes("write:org,repo").is_ok());
    EXPECT_TRUE(check_minimum_scopes("").is_ok());
}

TEST(MinimumScopesTest, MissingScopesNamed) {
    auto r = check_minimum_scopes("gist");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Validation);
    EXPECT_EQ(r.error, "missing required scope(s): repo, read:org");

    auto org_only = check_minimum_scopes("read:org");
    EXPECT_EQ(org_only.error, "missing required scope(s): repo");
}

TEST(FormEncodeTest, EscapesReservedCharacters) {
    EXPECT_EQ(form_encode({{"client_id", "abc"}, {"scope", "repo read:org"}}),
              "client_id=abc&scope=repo%20read%3Aorg");
    EXPECT_EQ(url_escape("a-b_c.d~e"), "a-b_c.d~e");
    EXPECT_EQ(url_escape("a/b&c"), "a%2Fb%26c");
}

TEST(HttpResponseTest, HeaderLookupIsCaseInsensitive) {
    HttpResponse r;
    r.headers["x-oauth-scopes"] = "repo";
    EXPECT_EQ(r.header("X-OAuth-Scopes"), "repo");
    EXPECT_FALSE(r.header("x-missing").has_value());
}

class ApiClientTest : public ::testing::Test {
protected:
    FakeHttpClient http;
};

TEST_F(ApiClientTest, CurrentLoginQueriesViewer) {
    http.route_json("api.github.com/graphql", viewer_body("monalisa"));
    ApiClient api(http);

    auto r = api.current_login("github.com", "gho_abc");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "monalisa");

    const HttpRequest& req = http.requests.back();
    EXPECT_EQ(req.method, "POST");
    EXPECT_NE(req.body.find("viewer"), std::string::npos);
    bool has_auth = false;
    for (const auto& [k, v] : req.headers) {
        if (k == "Authorization" && v == "token gho_abc") has_auth = true;
    }
    EXPECT_TRUE(has_auth);
}

TEST_F(ApiClientTest, CurrentLoginEnterpriseEndpoint) {
    http.route_json("ghe.example.com/api/graphql", viewer_body("admin"));
    ApiClient api(http);
    auto r = api.current_login("ghe.example.com", "gho_abc");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "admin");
}

TEST_F(ApiClientTest, CurrentLoginGraphqlErrors) {
    http.route_json("/graphql", "{\"errors\":[{\"message\":\"Bad credentials\"}]}");
    ApiClient api(http);
    auto r = api.current_login("github.com", "gho_abc");
    EXPECT_EQ(r.kind, ErrorKind::Protocol);
    EXPECT_NE(r.error.find("Bad credentials"), std::string::npos);
}

TEST_F(ApiClientTest, TokenScopesReadsHeader) {
    http.route("api.github.com", scopes_response("repo, read:org"));
    ApiClient api(http);
    auto r = api.token_scopes("github.com", "gho_abc");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "repo, read:org");
}

TEST_F(ApiClientTest, TokenScopesInvalidToken) {
    http.route("api.github.com", scopes_response("", 401));
    ApiClient api(http);
    auto r = api.token_scopes("github.com", "gho_bad");
    EXPECT_EQ(r.kind, ErrorKind::Validation);
}
