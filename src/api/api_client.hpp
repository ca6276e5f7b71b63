#pragma once

#include <string>
#include <vector>
#include "http_client.hpp"

// The few API calls the auth commands make with a bare token.
class ApiClient {
public:
    explicit ApiClient(HttpClient& http) : http_(http) {}

    // Login of the token's owner, from GraphQL `viewer { login }`.
    Result<std::string> current_login(const std::string& host, const std::string& token);

    // Raw X-OAuth-Scopes header of the API root. Empty for tokens without
    // classic scopes (fine-grained, app tokens).
    Result<std::string> token_scopes(const std::string& host, const std::string& token);

private:
    HttpClient& http_;
};

// Requires "repo" and one of read:org, write:org, admin:org. An empty scope
// header is accepted.
Result<void> check_minimum_scopes(const std::string& scopes_header);

// "gho_" + asterisks; tokens without an underscore are fully masked.
std::string mask_token(const std::string& token);

// Classic and OAuth app tokens carry scopes worth checking.
bool expect_scopes(const std::string& token);
