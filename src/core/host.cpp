#include "host.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <fmt/format.h>

namespace host {

std::string normalize(const std::string& hostname) {
    std::string h = trimmed(hostname);
    for (const char* scheme : {"https://", "http://"}) {
        std::string s(scheme);
        if (h.compare(0, s.size(), s) == 0) {
            h.erase(0, s.size());
            break;
        }
    }
    while (!h.empty() && h.back() == '/') h.pop_back();
    return to_lower(h);
}

bool is_github_com(const std::string& hostname) {
    std::string h = normalize(hostname);
    return h == GITHUB_COM || h == GITHUB_LOCALHOST;
}

bool is_tenancy(const std::string& hostname) {
    std::string h = normalize(hostname);
    std::string suffix(TENANCY_SUFFIX);
    return h.size() > suffix.size() &&
           h.compare(h.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_enterprise(const std::string& hostname) {
    return !is_github_com(hostname) && !is_tenancy(hostname);
}

std::string web_url(const std::string& hostname) {
    if (is_github_com(hostname)) return "https://github.com/";
    return fmt::format("https://{}/", normalize(hostname));
}

std::string rest_url(const std::string& hostname) {
    std::string h = normalize(hostname);
    if (is_github_com(h)) return "https://api.github.com/";
    if (is_tenancy(h)) return fmt::format("https://api.{}/", h);
    return fmt::format("https://{}/api/v3/", h);
}

std::string graphql_url(const std::string& hostname) {
    std::string h = normalize(hostname);
    if (is_github_com(h)) return "https://api.github.com/graphql";
    if (is_tenancy(h)) return fmt::format("https://api.{}/graphql", h);
    return fmt::format("https://{}/api/graphql", h);
}

std::string device_code_url(const std::string& hostname) {
    return web_url(hostname) + "login/device/code";
}

std::string access_token_url(const std::string& hostname) {
    return web_url(hostname) + "login/oauth/access_token";
}

} // namespace host
