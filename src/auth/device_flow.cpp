#include "device_flow.hpp"
#include <api/api_client.hpp>
#include <core/constants.hpp>
#include <core/host.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <thread>
#include <fmt/format.h>

using json = nlohmann::json;

static void real_sleep(std::chrono::seconds d) {
    std::this_thread::sleep_for(d);
}

DeviceFlow::DeviceFlow(HttpClient& http, SteadyClock clock, Sleeper sleep)
    : http_(http),
      clock_(clock ? std::move(clock) : SteadyClock(std::chrono::steady_clock::now)),
      sleep_(sleep ? std::move(sleep) : Sleeper(real_sleep)) {}

static HttpRequest form_post(const std::string& url,
                             const std::vector<std::pair<std::string, std::string>>& fields) {
    HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.headers = {
        {"Accept", "application/json"},
        {"Content-Type", "application/x-www-form-urlencoded"},
    };
    req.body = form_encode(fields);
    return req;
}

struct TokenResponse {
    std::string access_token;
    std::string error;
    std::string error_description;
};

// Missing and null fields read as "".
static std::string string_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

static Result<TokenResponse> parse_token_response(const HttpResponse& resp) {
    json body = json::parse(resp.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Result<TokenResponse>::Err(ErrorKind::Protocol,
            fmt::format("unexpected token response (HTTP {}): {}", resp.status, trimmed(resp.body)));
    }
    TokenResponse out;
    out.access_token = string_field(body, "access_token");
    out.error = string_field(body, "error");
    out.error_description = string_field(body, "error_description");
    return Result<TokenResponse>::Ok(out);
}

Result<DeviceCode> DeviceFlow::request_code(const std::string& host,
                                            const std::vector<std::string>& scopes) {
    std::vector<std::string> effective = scopes;
    if (effective.empty()) {
        effective.assign(std::begin(DEFAULT_SCOPES), std::end(DEFAULT_SCOPES));
    }

    HttpRequest req = form_post(host::device_code_url(host), {
        {"client_id", OAUTH_CLIENT_ID},
        {"scope", join(effective, " ")},
    });

    auto resp = http_.send(req);
    if (resp.is_err()) return Result<DeviceCode>::From(resp);

    if (!resp.value.ok()) {
        return Result<DeviceCode>::Err(ErrorKind::Transport,
            fmt::format("device code request failed: HTTP {}: {}",
                        resp.value.status, trimmed(resp.value.body)));
    }

    try {
        json body = json::parse(resp.value.body);
        DeviceCode code;
        code.device_code = body.at("device_code").get<std::string>();
        code.user_code = body.at("user_code").get<std::string>();
        code.verification_uri = body.at("verification_uri").get<std::string>();
        code.expires_in = body.at("expires_in").get<int>();
        code.interval = body.value("interval", DEVICE_POLL_MIN_INTERVAL_SECS);

        ghx_logf("device flow: code issued for {}, expires in {}s, interval {}s",
                 host, code.expires_in, code.interval);
        return Result<DeviceCode>::Ok(code);
    } catch (const json::exception& e) {
        return Result<DeviceCode>::Err(ErrorKind::Protocol,
            fmt::format("unexpected device code response: {}", e.what()));
    }
}

Result<std::string> DeviceFlow::poll_token(const std::string& host, const DeviceCode& code) {
    auto interval = std::chrono::seconds(std::max(code.interval, DEVICE_POLL_MIN_INTERVAL_SECS));
    auto deadline = clock_() + std::chrono::seconds(code.expires_in);
    std::string url = host::access_token_url(host);

    auto expired = [&]() {
        return Result<std::string>::Err(ErrorKind::Expired,
            "the device code has expired; run the login again");
    };

    for (;;) {
        sleep_(interval);
        if (clock_() > deadline) return expired();

        HttpRequest req = form_post(url, {
            {"client_id", OAUTH_CLIENT_ID},
            {"device_code", code.device_code},
            {"grant_type", DEVICE_GRANT_TYPE},
        });
        polls_++;
        auto resp = http_.send(req);
        if (resp.is_err()) return Result<std::string>::From(resp);

        auto parsed = parse_token_response(resp.value);
        if (parsed.is_err()) return Result<std::string>::From(parsed);
        const TokenResponse& body = parsed.value;

        if (!body.access_token.empty()) {
            ghx_logf("device flow: token received after {} poll(s)", polls_);
            return Result<std::string>::Ok(body.access_token);
        }

        const std::string& error = body.error;
        if (error == "slow_down") {
            interval += std::chrono::seconds(DEVICE_SLOW_DOWN_SECS);
            ghx_logf("device flow: slow_down, interval now {}s", interval.count());
        } else if (!error.empty() && error != "authorization_pending") {
            return Result<std::string>::Err(ErrorKind::Protocol,
                fmt::format("{} - {}", error, body.error_description));
        }

        if (clock_() > deadline) return expired();
    }
}

Result<DeviceFlowResult> DeviceFlow::run(const std::string& host,
                                         const std::vector<std::string>& scopes,
                                         const DeviceFlowUI& ui) {
    polls_ = 0;

    auto code = request_code(host, scopes);
    if (code.is_err()) return Result<DeviceFlowResult>::From(code);

    if (ui.show_code) ui.show_code(code.value);

    if (ui.copy_code) {
        auto r = ui.copy_code(code.value.user_code);
        if (r.is_err() && ui.warn) ui.warn(fmt::format("failed to copy to clipboard: {}", r.error));
    }
    if (ui.open_url) {
        auto r = ui.open_url(code.value.verification_uri);
        if (r.is_err() && ui.warn) {
            ui.warn(fmt::format("failed to open browser: {}\n  Open this URL manually: {}",
                                r.error, code.value.verification_uri));
        }
    }

    auto token = poll_token(host, code.value);
    if (token.is_err()) return Result<DeviceFlowResult>::From(token);

    ApiClient api(http_);
    auto login = api.current_login(host, token.value);
    if (login.is_err()) {
        auto failed = Result<DeviceFlowResult>::Err(login.kind,
            fmt::format("failed to retrieve username: {}", login.error));
        failed.value.token = token.value;
        return failed;
    }

    return Result<DeviceFlowResult>::Ok({token.value, login.value});
}
