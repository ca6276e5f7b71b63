#pragma once

// Test doubles shared by the test files: environment, HTTP, keychain.

#include <api/http_client.hpp>
#include <core/keyring.hpp>
#include <core/types.hpp>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// ── Environment ─────────────────────────────────────────────

inline EnvLookup env_from(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end() || it->second.empty()) return std::nullopt;
        return it->second;
    };
}

inline EnvLookup empty_env() {
    return env_from({});
}

// ── HTTP ────────────────────────────────────────────────────

// Responses are queued per URL substring and handed out in order; the last
// response of a route repeats. The longest matching substring is used.
class FakeHttpClient : public HttpClient {
public:
    void route(const std::string& url_part, HttpResponse response) {
        routes_[url_part].push_back(std::move(response));
    }

    void route_json(const std::string& url_part, const std::string& body, long status = 200) {
        HttpResponse r;
        r.status = status;
        r.body = body;
        route(url_part, r);
    }

    void fail(const std::string& url_part, const std::string& error) {
        failures_[url_part] = error;
    }

    Result<HttpResponse> send(const HttpRequest& request) override {
        requests.push_back(request);

        for (const auto& [part, error] : failures_) {
            if (request.url.find(part) != std::string::npos) {
                return Result<HttpResponse>::Err(ErrorKind::Transport, error);
            }
        }
        // Longest matching route wins.
        std::deque<HttpResponse>* best = nullptr;
        size_t best_len = 0;
        for (auto& [part, queue] : routes_) {
            if (request.url.find(part) == std::string::npos || queue.empty()) continue;
            if (!best || part.size() > best_len) {
                best = &queue;
                best_len = part.size();
            }
        }
        if (!best) {
            return Result<HttpResponse>::Err(ErrorKind::Transport, "no fake response for " + request.url);
        }
        HttpResponse r = best->front();
        if (best->size() > 1) best->pop_front();
        return Result<HttpResponse>::Ok(r);
    }

    int count(const std::string& url_part) const {
        int n = 0;
        for (const auto& r : requests) {
            if (r.url.find(url_part) != std::string::npos) n++;
        }
        return n;
    }

    std::vector<HttpRequest> requests;

private:
    std::map<std::string, std::deque<HttpResponse>> routes_;
    std::map<std::string, std::string> failures_;
};

inline HttpResponse scopes_response(const std::string& scopes, long status = 200) {
    HttpResponse r;
    r.status = status;
    r.body = "{}";
    if (!scopes.empty()) r.headers["x-oauth-scopes"] = scopes;
    return r;
}

inline std::string viewer_body(const std::string& login) {
    return "{\"data\":{\"viewer\":{\"login\":\"" + login + "\"}}}";
}

// ── Keychain ────────────────────────────────────────────────

// In-memory keychain. block() makes every call wait until release(), to
// simulate an unanswered unlock prompt.
class FakeKeyring : public KeyringBackend {
public:
    Result<std::optional<std::string>> get(const std::string& service,
                                           const std::string& account) override {
        wait_if_blocked();
        std::lock_guard<std::mutex> lock(mu_);
        calls++;
        if (!fail_with.empty()) return Result<std::optional<std::string>>::Err(ErrorKind::Storage, fail_with);
        auto it = entries.find({service, account});
        if (it == entries.end()) return Result<std::optional<std::string>>::Ok(std::nullopt);
        return Result<std::optional<std::string>>::Ok(it->second);
    }

    Result<void> set(const std::string& service,
                     const std::string& account,
                     const std::string& secret) override {
        wait_if_blocked();
        std::lock_guard<std::mutex> lock(mu_);
        calls++;
        if (!fail_with.empty()) return Result<void>::Err(ErrorKind::Storage, fail_with);
        entries[{service, account}] = secret;
        return Result<void>::Ok();
    }

    Result<void> remove(const std::string& service,
                        const std::string& account) override {
        wait_if_blocked();
        std::lock_guard<std::mutex> lock(mu_);
        calls++;
        if (!fail_with.empty()) return Result<void>::Err(ErrorKind::Storage, fail_with);
        entries.erase({service, account});
        return Result<void>::Ok();
    }

    const char* name() const override { return "fake"; }
    bool plaintext() const override { return on_disk; }

    void block() {
        std::lock_guard<std::mutex> lock(block_mu_);
        blocked_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(block_mu_);
            blocked_ = false;
        }
        block_cv_.notify_all();
    }

    bool has(const std::string& service, const std::string& account) {
        std::lock_guard<std::mutex> lock(mu_);
        return entries.count({service, account}) > 0;
    }

    std::string secret(const std::string& service, const std::string& account) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries.find({service, account});
        return it == entries.end() ? "" : it->second;
    }

    std::map<std::pair<std::string, std::string>, std::string> entries;
    std::string fail_with;
    bool on_disk = false;
    int calls = 0;

private:
    void wait_if_blocked() {
        std::unique_lock<std::mutex> lock(block_mu_);
        block_cv_.wait(lock, [this] { return !blocked_; });
    }

    std::mutex mu_;
    std::mutex block_mu_;
    std::condition_variable block_cv_;
    bool blocked_ = false;
};
