#pragma once

#include <curl/curl.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace datafeed {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpOptions {
    long timeout_ms = 15000;
    long connect_timeout_ms = 5000;
    std::string user_agent = "chainbt/1.0";
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    double total_ms = 0.0;
};

class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message, long status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    [[nodiscard]] long status_code() const noexcept { return status_code_; }

private:
    long status_code_;
};

// Blocking libcurl wrapper; one easy handle per request.
class HttpClient {
public:
    explicit HttpClient(HttpOptions options = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept = delete;
    HttpClient& operator=(HttpClient&&) noexcept = delete;

    // Throws HttpError on transport failure or a status >= 400.
    HttpResponse get(const std::string& url, const HttpHeaders& headers = {}) const;

private:
    HttpOptions options_;
    bool global_initialized_;
};

} // namespace datafeed
