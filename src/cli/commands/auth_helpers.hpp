#pragma once

#include "../auth_cli.hpp"
#include <auth/device_flow.hpp>
#include <string>
#include <vector>

// Shared helpers used by login.cpp, refresh.cpp and setup_git.cpp

// Prints the code and the URL to ctx.err. With a prompter the browser opens
// after Enter; without one the URL is only printed.
DeviceFlowUI make_device_flow_ui(AuthContext& ctx, bool copy_code);

// Minimum scopes check (skipped for tokens without classic scopes) and
// login lookup for a pasted token. Returns the username.
Result<std::string> validate_pasted_token(AuthContext& ctx,
                                          const std::string& host,
                                          const std::string& token);

// Points git's credential helper for https://{host} (and gist.{host} on
// github.com) at `ghx auth git-credential`.
Result<void> configure_git_helper(AuthContext& ctx, const std::string& host);

// Base scopes plus additions, in order and without duplicates.
std::vector<std::string> merge_scopes(const std::vector<std::string>& base,
                                      const std::vector<std::string>& added);
