#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

class AccountRegistry;
class Prompter;

// All (host, user) pairs matching the filters; empty filters match all.
// Active accounts come first within a host.
std::vector<HostUser> matching_accounts(const AccountRegistry& registry,
                                        const std::string& host_filter,
                                        const std::string& user_filter);

// Which account `auth logout` removes. One match is taken as is; several
// need a prompter, otherwise AmbiguousSelection.
Result<HostUser> select_logout_account(const AccountRegistry& registry,
                                       const std::string& host_filter,
                                       const std::string& user_filter,
                                       Prompter* prompter);

struct SwitchTarget {
    HostUser account;
    bool already_active = false;    // the only candidate is the active account
};

// Which account `auth switch` activates. With exactly two accounts on one
// host and no user filter the target is the inactive one.
Result<SwitchTarget> select_switch_account(const AccountRegistry& registry,
                                           const std::string& host_filter,
                                           const std::string& user_filter,
                                           Prompter* prompter);
