#include "account_selection.hpp"
#include "prompter.hpp"
#include <auth/account_registry.hpp>
#include <core/host.hpp>
#include <algorithm>
#include <fmt/format.h>

std::vector<HostUser> matching_accounts(const AccountRegistry& registry,
                                        const std::string& host_filter,
                                        const std::string& user_filter) {
    std::vector<HostUser> out;
    std::string wanted_host = host::normalize(host_filter);

    for (const auto& h : registry.hosts()) {
        if (!wanted_host.empty() && h != wanted_host) continue;

        auto users = registry.users_for_host(h);
        auto active = registry.active_user(h);
        if (active) {
            auto it = std::find(users.begin(), users.end(), *active);
            if (it != users.end()) std::rotate(users.begin(), it, it + 1);
        }
        for (const auto& u : users) {
            if (!user_filter.empty() && u != user_filter) continue;
            out.push_back({h, u});
        }
    }
    return out;
}

// Shared checks for logout and switch: something is logged in, and the host
// filter (if any) names a known host.
static Result<std::vector<HostUser>> candidates_for(const AccountRegistry& registry,
                                                    const std::string& host_filter,
                                                    const std::string& user_filter) {
    auto known = registry.hosts();
    if (known.empty()) {
        return Result<std::vector<HostUser>>::Err(ErrorKind::NotLoggedIn,
            "not logged in to any hosts");
    }

    if (!host_filter.empty()) {
        std::string h = host::normalize(host_filter);
        if (std::find(known.begin(), known.end(), h) == known.end()) {
            return Result<std::vector<HostUser>>::Err(ErrorKind::NotLoggedIn,
                fmt::format("not logged in to {}", h));
        }
    }

    auto matches = matching_accounts(registry, host_filter, user_filter);
    if (matches.empty()) {
        return Result<std::vector<HostUser>>::Err(ErrorKind::NotLoggedIn,
            "no accounts matched that criteria");
    }
    return Result<std::vector<HostUser>>::Ok(std::move(matches));
}

static Result<HostUser> prompt_for_account(const std::vector<HostUser>& candidates,
                                           const std::string& question,
                                           const std::string& action,
                                           Prompter* prompter) {
    if (!prompter) {
        return Result<HostUser>::Err(ErrorKind::AmbiguousSelection,
            fmt::format("unable to determine which account to {}, please specify `--hostname` and `--user`",
                        action));
    }

    std::vector<std::string> labels;
    labels.reserve(candidates.size());
    for (const auto& c : candidates) {
        labels.push_back(fmt::format("{} ({})", c.user, c.host));
    }

    auto choice = prompter->select(question, labels);
    if (choice.is_err()) return Result<HostUser>::From(choice);
    return Result<HostUser>::Ok(candidates[choice.value]);
}

Result<HostUser> select_logout_account(const AccountRegistry& registry,
                                       const std::string& host_filter,
                                       const std::string& user_filter,
                                       Prompter* prompter) {
    auto candidates = candidates_for(registry, host_filter, user_filter);
    if (candidates.is_err()) return Result<HostUser>::From(candidates);

    if (candidates.value.size() == 1) {
        return Result<HostUser>::Ok(candidates.value.front());
    }
    return prompt_for_account(candidates.value,
                              "What account do you want to log out of?",
                              "log out of", prompter);
}

Result<SwitchTarget> select_switch_account(const AccountRegistry& registry,
                                           const std::string& host_filter,
                                           const std::string& user_filter,
                                           Prompter* prompter) {
    auto candidates = candidates_for(registry, host_filter, user_filter);
    if (candidates.is_err()) return Result<SwitchTarget>::From(candidates);
    const auto& list = candidates.value;

    auto is_active = [&](const HostUser& hu) {
        auto active = registry.active_user(hu.host);
        return active && *active == hu.user;
    };

    if (list.size() == 1) {
        SwitchTarget t;
        t.account = list.front();
        t.already_active = is_active(t.account);
        return Result<SwitchTarget>::Ok(t);
    }

    // Two accounts on one host: the other one.
    if (list.size() == 2 && list[0].host == list[1].host) {
        for (const auto& c : list) {
            if (!is_active(c)) {
                SwitchTarget t;
                t.account = c;
                return Result<SwitchTarget>::Ok(t);
            }
        }
    }

    auto picked = prompt_for_account(list,
                                     "What account do you want to switch to?",
                                     "switch to", prompter);
    if (picked.is_err()) return Result<SwitchTarget>::From(picked);

    SwitchTarget t;
    t.account = picked.value;
    t.already_active = is_active(t.account);
    return Result<SwitchTarget>::Ok(t);
}
