#pragma once

#include <iosfwd>
#include <map>
#include <string>
#include <core/types.hpp>

class AccountRegistry;

// git credential helper protocol: `key=value` lines up to a blank line or
// EOF. A `url=` line is expanded into protocol, host, path, username and
// password.
std::map<std::string, std::string> read_credential_request(std::istream& in);

// Handle one helper invocation. `get` answers https requests for hosts with
// a token and writes nothing otherwise; `store` and `erase` consume their
// input and change nothing. Ok(true) when credentials were written.
Result<bool> run_git_credential(const std::string& operation,
                                const AccountRegistry& registry,
                                std::istream& in,
                                std::ostream& out);
