#include "http_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <mutex>
#include <fmt/format.h>

// ── CURL RAII helpers ───────────────────────────────────────

class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() {
        if (handle_) curl_easy_cleanup(handle_);
    }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }

private:
    CURL* handle_;
};

class CurlHeaderList {
public:
    CurlHeaderList() = default;
    ~CurlHeaderList() { curl_slist_free_all(list_); }

    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;

    void append(const std::string& line) { list_ = curl_slist_append(list_, line.c_str()); }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

static size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t real_size = size * nmemb;
    static_cast<std::string*>(userp)->append(contents, real_size);
    return real_size;
}

// Collects "Name: value" lines; a redirect or 100-continue starts a new set.
static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t real_size = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    std::string line(buffer, real_size);

    if (line.compare(0, 5, "HTTP/") == 0) {
        headers->clear();
        return real_size;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        (*headers)[to_lower(trimmed(line.substr(0, colon)))] = trimmed(line.substr(colon + 1));
    }
    return real_size;
}

// ── HttpResponse ────────────────────────────────────────────

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

// ── CurlHttpClient ──────────────────────────────────────────

CurlHttpClient::CurlHttpClient() : CurlHttpClient(HTTP_TIMEOUT_SECS) {}

CurlHttpClient::CurlHttpClient(long timeout_secs)
    : timeout_(timeout_secs),
      connect_timeout_(timeout_secs > HTTP_CONNECT_TIMEOUT_SECS ? HTTP_CONNECT_TIMEOUT_SECS : timeout_secs) {
    static std::once_flag init_flag;
    std::call_once(init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<HttpResponse> CurlHttpClient::send(const HttpRequest& request) {
    CurlHandle handle;
    if (!handle.get()) {
        return Result<HttpResponse>::Err(ErrorKind::Transport, "failed to initialize curl");
    }

    HttpResponse response;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(handle.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle.get(), CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, timeout_);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT, connect_timeout_);
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, HTTP_USER_AGENT);

    if (request.method == "POST") {
        curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(handle.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    CurlHeaderList header_list;
    for (const auto& [name, value] : request.headers) {
        header_list.append(fmt::format("{}: {}", name, value));
    }
    if (header_list.get()) {
        curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    ghx_logf("http: {} {}", request.method, request.url);
    CURLcode res = curl_easy_perform(handle.get());
    if (res != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(res);
        ghx_logf("http: {} {} failed: {}", request.method, request.url, detail);
        return Result<HttpResponse>::Err(ErrorKind::Transport,
            fmt::format("{} {} failed: {}", request.method, request.url, detail));
    }

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
    ghx_logf("http: {} {} -> {} ({} bytes)", request.method, request.url,
             response.status, response.body.size());
    return Result<HttpResponse>::Ok(response);
}

// ── Form encoding ───────────────────────────────────────────

std::string url_escape(const std::string& s) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) out += '&';
        out += url_escape(key);
        out += '=';
        out += url_escape(value);
    }
    return out;
}
