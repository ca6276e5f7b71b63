#include "git_credential.hpp"
#include "account_registry.hpp"
#include "env_token.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <istream>
#include <ostream>
#include <fmt/format.h>

// scheme://[user[:password]@]host[:port][/path]
static void expand_url(const std::string& url, std::map<std::string, std::string>& wants) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return;

    wants["protocol"] = url.substr(0, scheme_end);
    std::string rest = url.substr(scheme_end + 3);

    std::string path;
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        path = rest.substr(slash);
        rest = rest.substr(0, slash);
    }

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = rest.substr(0, at);
        rest = rest.substr(at + 1);
        auto colon = userinfo.find(':');
        wants["username"] = userinfo.substr(0, colon);
        wants["password"] = colon == std::string::npos ? "" : userinfo.substr(colon + 1);
    }

    wants["host"] = rest;
    wants["path"] = path;
}

std::map<std::string, std::string> read_credential_request(std::istream& in) {
    std::map<std::string, std::string> wants;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        std::string key, value;
        if (!split_key_value(line, key, value)) continue;
        if (key == "url") {
            expand_url(value, wants);
        } else {
            wants[key] = value;
        }
    }
    return wants;
}

static Result<bool> credential_get(const AccountRegistry& registry,
                                   std::istream& in,
                                   std::ostream& out) {
    auto wants = read_credential_request(in);

    if (wants["protocol"] != "https") {
        return Result<bool>::Ok(false);
    }
    std::string host = wants["host"];
    if (host.empty()) {
        return Result<bool>::Ok(false);
    }

    std::string lookup_host = host;
    auto token = registry.active_token(lookup_host);
    if (token.is_err()) return Result<bool>::From(token);

    if (!token.value && host.compare(0, 5, "gist.") == 0) {
        lookup_host = host.substr(5);
        token = registry.active_token(lookup_host);
        if (token.is_err()) return Result<bool>::From(token);
    }
    if (!token.value || token.value->token.empty()) {
        ghx_logf("git-credential: no token for {}", host);
        return Result<bool>::Ok(false);
    }

    // A request naming a different account than the active one is not ours to answer.
    const std::string& wanted_user = wants["username"];
    if (!wanted_user.empty() && wanted_user != GIT_TOKEN_USER &&
        token_source_writeable(token.value->source)) {
        auto active = registry.active_user(lookup_host);
        if (active && to_lower(*active) != to_lower(wanted_user)) {
            ghx_logf("git-credential: {} asked for {}, active account is {}", host, wanted_user, *active);
            return Result<bool>::Ok(false);
        }
    }

    out << "protocol=https\n"
        << "host=" << host << "\n"
        << "username=" << GIT_TOKEN_USER << "\n"
        << "password=" << token.value->token << "\n"
        << "\n";
    out.flush();
    return Result<bool>::Ok(true);
}

Result<bool> run_git_credential(const std::string& operation,
                                const AccountRegistry& registry,
                                std::istream& in,
                                std::ostream& out) {
    if (operation == "get") {
        return credential_get(registry, in, out);
    }
    if (operation == "store" || operation == "erase") {
        read_credential_request(in);
        return Result<bool>::Ok(false);
    }
    return Result<bool>::Err(ErrorKind::Validation,
        fmt::format("ghx auth git-credential: \"{}\" operation not supported", operation));
}
