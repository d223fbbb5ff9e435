#include "pagewright/infra/http_client.hpp"
#include "pagewright/core/logger.hpp"

#include <httplib.h>

#include <boost/asio/use_awaitable.hpp>

namespace pagewright::infra {

namespace {

auto to_http_response(const httplib::Result& result) -> Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        if (err == httplib::Error::ConnectionTimeout) {
            return std::unexpected(make_error(ErrorCode::Timeout, "HTTP request timed out",
                                              "Connection timeout"));
        }
        return std::unexpected(make_error(ErrorCode::ConnectionFailed, "HTTP request failed",
                                          httplib::to_string(err)));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;
    for (const auto& [key, value] : result->headers) {
        response.headers[key] = value;
    }
    return response;
}

auto to_headers(const std::map<std::string, std::string>& extra) -> httplib::Headers {
    httplib::Headers hdrs;
    for (const auto& [k, v] : extra) {
        hdrs.emplace(k, v);
    }
    return hdrs;
}

} // anonymous namespace

struct HttpClient::Impl {
    boost::asio::io_context& ioc;
    HttpClientConfig config;
    std::unique_ptr<httplib::Client> client;

    Impl(boost::asio::io_context& ioc_, HttpClientConfig config_)
        : ioc(ioc_), config(std::move(config_)) {
        client = std::make_unique<httplib::Client>(config.base_url);
        client->set_connection_timeout(config.timeout_seconds);
        client->set_read_timeout(config.timeout_seconds);
        client->set_write_timeout(config.timeout_seconds);
        client->set_follow_location(config.follow_redirects);
        if (!config.verify_ssl) {
            client->enable_server_certificate_verification(false);
        }
        client->set_default_headers(to_headers(config.default_headers));

        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }
};

HttpClient::HttpClient(boost::asio::io_context& ioc, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(ioc, std::move(config))) {}

HttpClient::~HttpClient() = default;

auto HttpClient::get(std::string_view path, const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    auto result = co_await boost::asio::co_spawn(
        boost::asio::make_strand(impl_->ioc),
        [this, p = std::string(path),
         hdrs = to_headers(headers)]() -> boost::asio::awaitable<Result<HttpResponse>> {
            LOG_DEBUG("GET {}{}", impl_->config.base_url, p);
            auto res = impl_->client->Get(p, hdrs);
            co_return to_http_response(res);
        },
        boost::asio::use_awaitable);
    co_return result;
}

auto HttpClient::post(std::string_view path, std::string_view body, std::string_view content_type,
                      const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    auto result = co_await boost::asio::co_spawn(
        boost::asio::make_strand(impl_->ioc),
        [this, p = std::string(path), b = std::string(body), ct = std::string(content_type),
         hdrs = to_headers(headers)]() -> boost::asio::awaitable<Result<HttpResponse>> {
            LOG_DEBUG("POST {}{} ({} bytes)", impl_->config.base_url, p, b.size());
            auto res = impl_->client->Post(p, hdrs, b, ct);
            co_return to_http_response(res);
        },
        boost::asio::use_awaitable);
    co_return result;
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace pagewright::infra
