#include "api_client.hpp"
#include <core/host.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fmt/format.h>

using json = nlohmann::json;

// Short body excerpt for error messages.
static std::string body_excerpt(const std::string& body) {
    std::string s = trimmed(body);
    if (s.size() > 200) s = s.substr(0, 200) + "...";
    return s;
}

Result<std::string> ApiClient::current_login(const std::string& host, const std::string& token) {
    HttpRequest req;
    req.method = "POST";
    req.url = host::graphql_url(host);
    req.headers = {
        {"Authorization", "token " + token},
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
    };
    req.body = json{{"query", "query UserCurrent{viewer{login}}"}}.dump();

    auto resp = http_.send(req);
    if (resp.is_err()) return Result<std::string>::From(resp);

    if (!resp.value.ok()) {
        return Result<std::string>::Err(ErrorKind::Transport,
            fmt::format("HTTP {} from {}: {}", resp.value.status, req.url, body_excerpt(resp.value.body)));
    }

    try {
        json body = json::parse(resp.value.body);
        if (body.contains("errors") && body["errors"].is_array() && !body["errors"].empty()) {
            std::vector<std::string> messages;
            for (const auto& e : body["errors"]) {
                messages.push_back(e.value("message", "unknown error"));
            }
            return Result<std::string>::Err(ErrorKind::Protocol,
                fmt::format("GraphQL: {}", join(messages, ", ")));
        }

        const json& login = body.at("data").at("viewer").at("login");
        if (!login.is_string() || login.get<std::string>().empty()) {
            return Result<std::string>::Err(ErrorKind::Protocol, "viewer login missing from response");
        }
        return Result<std::string>::Ok(login.get<std::string>());
    } catch (const json::exception& e) {
        return Result<std::string>::Err(ErrorKind::Protocol,
            fmt::format("unexpected response from {}: {}", req.url, e.what()));
    }
}

Result<std::string> ApiClient::token_scopes(const std::string& host, const std::string& token) {
    HttpRequest req;
    req.method = "GET";
    req.url = host::rest_url(host);
    req.headers = {
        {"Authorization", "token " + token},
        {"Accept", "application/vnd.github+json"},
    };

    auto resp = http_.send(req);
    if (resp.is_err()) return Result<std::string>::From(resp);

    if (resp.value.status == 401) {
        return Result<std::string>::Err(ErrorKind::Validation, "the token is invalid or has expired");
    }
    if (!resp.value.ok()) {
        return Result<std::string>::Err(ErrorKind::Transport,
            fmt::format("HTTP {} from {}: {}", resp.value.status, req.url, body_excerpt(resp.value.body)));
    }
    return Result<std::string>::Ok(resp.value.header("x-oauth-scopes").value_or(""));
}

Result<void> check_minimum_scopes(const std::string& scopes_header) {
    if (trimmed(scopes_header).empty()) {
        return Result<void>::Ok();
    }

    auto scopes = split_list(scopes_header, ',');
    auto has = [&](const char* s) {
        return std::find(scopes.begin(), scopes.end(), s) != scopes.end();
    };

    std::vector<std::string> missing;
    if (!has("repo")) missing.push_back("repo");
    if (!has("read:org") && !has("write:org") && !has("admin:org")) missing.push_back("read:org");

    if (!missing.empty()) {
        return Result<void>::Err(ErrorKind::Validation,
            fmt::format("missing required scope(s): {}", join(missing, ", ")));
    }
    return Result<void>::Ok();
}

std::string mask_token(const std::string& token) {
    auto idx = token.rfind('_');
    if (idx == std::string::npos) {
        return std::string(token.size(), '*');
    }
    return token.substr(0, idx + 1) + std::string(token.size() - idx - 1, '*');
}

bool expect_scopes(const std::string& token) {
    return token.compare(0, 4, "ghp_") == 0 || token.compare(0, 4, "gho_") == 0;
}
