#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio.hpp>

#include "pagewright/core/error.hpp"

namespace pagewright::infra {

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

struct HttpClientConfig {
    /// Scheme, host and optional port, e.g. "https://api.openai.com".
    std::string base_url;
    int timeout_seconds = 30;
    bool verify_ssl = true;
    bool follow_redirects = true;
    std::map<std::string, std::string> default_headers;
};

/// Asynchronous HTTP client wrapping cpp-httplib.
/// Provides awaitable methods compatible with boost::asio coroutines.
class HttpClient {
public:
    HttpClient(boost::asio::io_context& ioc, HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    auto get(std::string_view path, const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    auto post(std::string_view path, std::string_view body,
              std::string_view content_type = "application/json",
              const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pagewright::infra
