#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <core/types.hpp>
#include <api/http_client.hpp>

struct DeviceCode {
    std::string device_code;
    std::string user_code;
    std::string verification_uri;
    int expires_in = 0;     // seconds
    int interval = 0;       // seconds, as sent by the server
};

struct DeviceFlowResult {
    std::string token;
    std::string username;
};

// Interaction hooks. All optional; copy_code and open_url are best-effort
// and their failures are passed to warn().
struct DeviceFlowUI {
    std::function<void(const DeviceCode& code)> show_code;
    std::function<Result<void>(const std::string& user_code)> copy_code;
    std::function<Result<void>(const std::string& url)> open_url;
    std::function<void(const std::string& message)> warn;
};

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;
using Sleeper = std::function<void(std::chrono::seconds)>;

// OAuth 2.0 device authorization grant against one host:
// request a code, show it, poll the token endpoint, then resolve the login.
//
// Polling waits `interval` seconds (never less than 5) before every poll.
// slow_down raises the interval by 5 seconds for the rest of the flow. The
// deadline (start + expires_in) is checked before each poll and after every
// response that is not a token.
class DeviceFlow {
public:
    explicit DeviceFlow(HttpClient& http,
                        SteadyClock clock = std::chrono::steady_clock::now,
                        Sleeper sleep = nullptr);

    // Empty scopes request the default set. On a failed login lookup the
    // result is an error whose value still carries the token.
    Result<DeviceFlowResult> run(const std::string& host,
                                 const std::vector<std::string>& scopes,
                                 const DeviceFlowUI& ui);

    Result<DeviceCode> request_code(const std::string& host,
                                    const std::vector<std::string>& scopes);

    Result<std::string> poll_token(const std::string& host, const DeviceCode& code);

    int polls() const { return polls_; }

private:
    HttpClient& http_;
    SteadyClock clock_;
    Sleeper sleep_;
    int polls_ = 0;
};
