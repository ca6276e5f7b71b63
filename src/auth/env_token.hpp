#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// Token supplied through the environment for a host. github.com and
// *.ghe.com tenants read GH_TOKEN then GITHUB_TOKEN; enterprise servers read
// GH_ENTERPRISE_TOKEN then GITHUB_ENTERPRISE_TOKEN. The source is the
// variable name.
std::optional<AuthToken> token_from_env(const std::string& hostname, const EnvLookup& env);

// Tokens from *_TOKEN variables cannot be changed by this tool.
bool token_source_writeable(const std::string& source);
