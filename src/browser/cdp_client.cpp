#include "pagewright/browser/cdp_client.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"

#include <boost/asio.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <mutex>
#include <unordered_map>

namespace pagewright::browser {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

struct PendingCommand {
    std::string method;
    std::function<void(Result<json>)> callback;
};

struct WsTarget {
    std::string host;
    std::string port;
    std::string path;
};

auto parse_ws_url(std::string_view url) -> Result<WsTarget> {
    size_t start = 0;
    if (url.starts_with("ws://")) {
        start = 5;
    } else if (url.starts_with("wss://")) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "TLS DevTools endpoints are not supported",
                                          std::string(url)));
    } else {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Not a WebSocket URL", std::string(url)));
    }

    WsTarget target;
    auto path_pos = url.find('/', start);
    auto host_port = std::string(url.substr(start, path_pos - start));
    target.path = (path_pos != std::string_view::npos) ? std::string(url.substr(path_pos)) : "/";

    auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        target.host = host_port.substr(0, colon_pos);
        target.port = host_port.substr(colon_pos + 1);
    } else {
        target.host = host_port;
        target.port = "80";
    }
    if (target.host.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "WebSocket URL has no host", std::string(url)));
    }
    return target;
}

} // anonymous namespace

struct CdpClient::Impl {
    net::io_context& ioc;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> ws;
    std::string url;
    std::atomic<bool> connected{false};
    std::atomic<int> next_id{1};

    std::mutex pending_mutex;
    std::unordered_map<int, PendingCommand> pending_commands;

    std::mutex handler_mutex;
    std::unordered_map<std::string, EventHandler> event_handlers;

    explicit Impl(net::io_context& ctx) : ioc(ctx) {}

    auto allocate_id() -> int {
        return next_id.fetch_add(1, std::memory_order_relaxed);
    }

    void dispatch_message(const std::string& msg) {
        json j;
        try {
            j = json::parse(msg);
        } catch (const json::exception& e) {
            LOG_WARN("Failed to parse CDP message: {}", e.what());
            return;
        }

        if (j.contains("id")) {
            int id = j["id"].get<int>();

            PendingCommand command;
            {
                std::lock_guard lock(pending_mutex);
                auto it = pending_commands.find(id);
                if (it == pending_commands.end()) {
                    LOG_DEBUG("CDP reply for unknown command id {}", id);
                    return;
                }
                command = std::move(it->second);
                pending_commands.erase(it);
            }

            if (j.contains("error")) {
                auto& err = j["error"];
                command.callback(std::unexpected(make_error(
                    ErrorCode::BrowserError,
                    command.method + ": " + err.value("message", "CDP error"),
                    err.contains("data") ? err["data"].dump() : "")));
            } else {
                command.callback(j.value("result", json::object()));
            }
            return;
        }

        if (j.contains("method")) {
            auto method = j["method"].get<std::string>();
            EventHandler handler;
            {
                std::lock_guard lock(handler_mutex);
                auto it = event_handlers.find(method);
                if (it != event_handlers.end()) {
                    handler = it->second;
                }
            }
            if (handler) {
                handler(j.value("params", json::object()));
            }
        }
    }

    void fail_pending(const Error& error) {
        std::unordered_map<int, PendingCommand> pending;
        {
            std::lock_guard lock(pending_mutex);
            pending.swap(pending_commands);
        }
        for (auto& [id, cmd] : pending) {
            cmd.callback(std::unexpected(error));
        }
    }

    static auto read_loop(std::shared_ptr<Impl> self) -> awaitable<void> {
        beast::flat_buffer buffer;
        while (self->connected) {
            try {
                co_await self->ws->async_read(buffer, net::use_awaitable);
                auto msg = beast::buffers_to_string(buffer.data());
                buffer.consume(buffer.size());
                self->dispatch_message(msg);
            } catch (const beast::system_error& se) {
                if (se.code() != websocket::error::closed &&
                    se.code() != net::error::operation_aborted) {
                    LOG_ERROR("CDP read error: {}", se.what());
                }
                self->connected = false;
                break;
            }
        }
        self->fail_pending(make_error(ErrorCode::ConnectionClosed, "CDP connection closed",
                                      self->url));
    }
};

CdpClient::CdpClient(boost::asio::io_context& ioc)
    : impl_(std::make_shared<Impl>(ioc)) {}

CdpClient::~CdpClient() {
    if (impl_ && impl_->connected) {
        impl_->connected = false;
        if (impl_->ws) {
            beast::error_code ec;
            beast::get_lowest_layer(*impl_->ws).socket().close(ec);
        }
    }
}

auto CdpClient::connect(std::string_view ws_url) -> awaitable<Result<void>> {
    impl_->url = std::string(ws_url);

    auto target = parse_ws_url(ws_url);
    if (!target) {
        co_return make_fail(target.error());
    }

    try {
        tcp::resolver resolver(impl_->ioc);
        auto results = co_await resolver.async_resolve(target->host, target->port,
                                                       net::use_awaitable);

        impl_->ws = std::make_unique<websocket::stream<beast::tcp_stream>>(impl_->ioc);

        beast::get_lowest_layer(*impl_->ws).expires_after(std::chrono::seconds(30));
        auto ep = co_await beast::get_lowest_layer(*impl_->ws).async_connect(
            results, net::use_awaitable);
        auto host_str = target->host + ":" + std::to_string(ep.port());

        // The websocket layer has its own keep-alive timeouts.
        beast::get_lowest_layer(*impl_->ws).expires_never();
        impl_->ws->set_option(
            websocket::stream_base::timeout::suggested(beast::role_type::client));
        impl_->ws->set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "pagewright-cdp/" PAGEWRIGHT_VERSION_STRING);
            }));
        // Large DOM dumps and screenshots arrive as single frames.
        impl_->ws->read_message_max(64 * 1024 * 1024);

        co_await impl_->ws->async_handshake(host_str, target->path, net::use_awaitable);

        impl_->connected = true;
        LOG_INFO("CDP connected to {}", impl_->url);

        net::co_spawn(impl_->ioc, Impl::read_loop(impl_), net::detached);
        co_return ok_result();
    } catch (const beast::system_error& se) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed, "Failed to connect to CDP", se.what()));
    }
}

auto CdpClient::send_command(std::string_view method, json params)
    -> awaitable<Result<json>> {
    if (!impl_->connected) {
        co_return make_fail(make_error(ErrorCode::ConnectionClosed, "CDP client not connected",
                                       std::string(method)));
    }

    int id = impl_->allocate_id();
    json message = {
        {"id", id},
        {"method", std::string(method)},
        {"params", std::move(params)},
    };

    using channel_t =
        net::experimental::concurrent_channel<void(boost::system::error_code, Result<json>)>;
    auto channel = std::make_shared<channel_t>(impl_->ioc, 1);

    {
        std::lock_guard lock(impl_->pending_mutex);
        impl_->pending_commands[id] = PendingCommand{
            std::string(method),
            [channel](Result<json> result) {
                channel->try_send(boost::system::error_code{}, std::move(result));
            },
        };
    }

    try {
        auto msg_str = message.dump();
        co_await impl_->ws->async_write(net::buffer(msg_str), net::use_awaitable);
    } catch (const beast::system_error& se) {
        {
            std::lock_guard lock(impl_->pending_mutex);
            impl_->pending_commands.erase(id);
        }
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed, "Failed to send CDP command", se.what()));
    }

    LOG_TRACE("CDP -> {} (#{})", std::string(method), id);
    auto result = co_await channel->async_receive(net::use_awaitable);
    co_return result;
}

void CdpClient::subscribe(std::string_view event, EventHandler handler) {
    std::lock_guard lock(impl_->handler_mutex);
    impl_->event_handlers[std::string(event)] = std::move(handler);
    LOG_DEBUG("Subscribed to CDP event: {}", std::string(event));
}

void CdpClient::unsubscribe(std::string_view event) {
    std::lock_guard lock(impl_->handler_mutex);
    impl_->event_handlers.erase(std::string(event));
    LOG_DEBUG("Unsubscribed from CDP event: {}", std::string(event));
}

auto CdpClient::disconnect() -> awaitable<void> {
    if (!impl_->connected) {
        co_return;
    }
    impl_->connected = false;

    if (impl_->ws) {
        try {
            co_await impl_->ws->async_close(websocket::close_code::normal, net::use_awaitable);
        } catch (const beast::system_error& se) {
            // The browser may already be gone; drop the socket.
            LOG_DEBUG("CDP close handshake failed: {}", se.what());
            beast::error_code ec;
            beast::get_lowest_layer(*impl_->ws).socket().close(ec);
        }
    }

    LOG_INFO("CDP disconnected from {}", impl_->url);
}

auto CdpClient::is_connected() const -> bool {
    return impl_ && impl_->connected;
}

auto CdpClient::ws_url() const -> std::string_view {
    return impl_->url;
}

} // namespace pagewright::browser
