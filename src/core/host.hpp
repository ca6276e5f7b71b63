#pragma once

#include <string>

// Hostname handling for the three kinds of instance: github.com, GHE.com
// tenants (*.ghe.com) and enterprise servers.
namespace host {

// Strip scheme and trailing slashes, lowercase.
std::string normalize(const std::string& hostname);

bool is_github_com(const std::string& hostname);
bool is_tenancy(const std::string& hostname);
bool is_enterprise(const std::string& hostname);

// https://github.com/ for github.com, https://{host}/ otherwise.
std::string web_url(const std::string& hostname);

std::string rest_url(const std::string& hostname);
std::string graphql_url(const std::string& hostname);

std::string device_code_url(const std::string& hostname);
std::string access_token_url(const std::string& hostname);

} // namespace host
