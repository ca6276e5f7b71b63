#include "env_token.hpp"
#include <core/host.hpp>

std::optional<AuthToken> token_from_env(const std::string& hostname, const EnvLookup& env) {
    static const char* const cloud_vars[] = {"GH_TOKEN", "GITHUB_TOKEN"};
    static const char* const enterprise_vars[] = {"GH_ENTERPRISE_TOKEN", "GITHUB_ENTERPRISE_TOKEN"};

    const auto& vars = host::is_enterprise(hostname) ? enterprise_vars : cloud_vars;
    for (const char* name : vars) {
        if (auto value = env(name)) {
            return AuthToken{*value, name};
        }
    }
    return std::nullopt;
}

bool token_source_writeable(const std::string& source) {
    static const std::string suffix = "_TOKEN";
    return !(source.size() >= suffix.size() &&
             source.compare(source.size() - suffix.size(), suffix.size(), suffix) == 0);
}
