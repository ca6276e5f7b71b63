#pragma once

#include <string>
#include <vector>
#include <map>
#include <utility>
#include <optional>
#include <core/types.hpp>

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;   // keys lowercased
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
    std::optional<std::string> header(const std::string& name) const;
};

// Transport seam. Network failures come back as ErrorKind::Transport; any
// HTTP status, including 4xx/5xx, is a successful exchange.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    explicit CurlHttpClient(long timeout_secs);

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    long timeout_;
    long connect_timeout_;
};

// application/x-www-form-urlencoded body from ordered fields.
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);
std::string url_escape(const std::string& s);
