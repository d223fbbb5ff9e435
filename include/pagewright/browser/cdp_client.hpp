#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

#include "pagewright/core/error.hpp"

namespace pagewright::browser {

using boost::asio::awaitable;
using json = nlohmann::json;

/// Callback type for CDP event subscriptions.
using EventHandler = std::function<void(json)>;

/// Chrome DevTools Protocol WebSocket client bound to one page target.
///
/// All I/O runs on the io_context passed at construction. The background
/// read loop shares ownership of the connection state, so the client may be
/// destroyed while a read is still pending.
class CdpClient {
public:
    explicit CdpClient(boost::asio::io_context& ioc);
    ~CdpClient();

    CdpClient(const CdpClient&) = delete;
    CdpClient& operator=(const CdpClient&) = delete;

    /// Connect to the page's DevTools WebSocket endpoint.
    auto connect(std::string_view ws_url) -> awaitable<Result<void>>;

    /// Send a CDP command and await its result.
    auto send_command(std::string_view method, json params = json::object())
        -> awaitable<Result<json>>;

    /// Subscribe to a CDP event. One handler per event; a new one replaces
    /// the previous.
    void subscribe(std::string_view event, EventHandler handler);
    void unsubscribe(std::string_view event);

    auto disconnect() -> awaitable<void>;

    [[nodiscard]] auto is_connected() const -> bool;
    [[nodiscard]] auto ws_url() const -> std::string_view;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace pagewright::browser
