#include "pagewright/browser/cdp_driver.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <future>

namespace pagewright::browser {

namespace net = boost::asio;

CdpDriver::CdpDriver() = default;

CdpDriver::~CdpDriver() {
    shutdown();
}

template <typename T>
auto CdpDriver::block_on(net::awaitable<Result<T>> op) -> Result<T> {
    if (ioc_.stopped()) {
        ioc_.restart();
    }
    auto future = net::co_spawn(ioc_, std::move(op), net::use_future);
    while (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        if (ioc_.run_one() == 0) {
            ioc_.restart();
        }
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return std::unexpected(make_error(ErrorCode::InternalError, "CDP operation threw",
                                          e.what()));
    }
}

auto CdpDriver::require_open() const -> VoidResult {
    if (!is_open()) {
        return std::unexpected(make_error(ErrorCode::InvalidState, "Browser is not open"));
    }
    return {};
}

auto CdpDriver::connect_page() -> awaitable<Result<void>> {
    auto connected = co_await cdp_->connect(process_->page_ws_url);
    if (!connected) {
        co_return make_fail(connected.error());
    }

    for (const auto* domain : {"Page.enable", "Runtime.enable", "DOM.enable", "Network.enable"}) {
        auto enabled = co_await cdp_->send_command(domain);
        if (!enabled) {
            LOG_WARN("Failed to enable {}: {}", domain, enabled.error().what());
        }
    }
    co_return ok_result();
}

// -- Lifecycle --

auto CdpDriver::open(const LaunchOptions& options) -> VoidResult {
    if (is_open()) {
        return std::unexpected(make_error(ErrorCode::InvalidState, "Browser is already open"));
    }

    auto process = launch_chrome(options);
    if (!process) {
        return std::unexpected(process.error());
    }
    process_ = std::move(*process);
    options_ = options;

    cdp_ = std::make_unique<CdpClient>(ioc_);
    auto connected = block_on(connect_page());
    if (!connected) {
        LOG_ERROR("Could not attach to Chrome page: {}", connected.error().what());
        shutdown();
        return std::unexpected(connected.error());
    }

    page_ = std::make_unique<PageActions>(*cdp_);
    LOG_INFO("Browser opened (headless={})", options.headless);
    return {};
}

auto CdpDriver::close() -> VoidResult {
    if (!process_) {
        return {};
    }

    if (cdp_ && cdp_->is_connected()) {
        auto closed = block_on(cdp_->send_command("Browser.close"));
        if (!closed) {
            LOG_DEBUG("Browser.close failed, terminating process: {}", closed.error().what());
        }
    }
    shutdown();
    LOG_INFO("Browser closed");
    return {};
}

void CdpDriver::shutdown() {
    if (cdp_ && cdp_->is_connected()) {
        auto disconnected = block_on([](CdpClient& cdp) -> awaitable<Result<void>> {
            co_await cdp.disconnect();
            co_return ok_result();
        }(*cdp_));
        if (!disconnected) {
            LOG_DEBUG("CDP disconnect failed: {}", disconnected.error().what());
        }
    }
    page_.reset();
    cdp_.reset();

    // Let the read loop observe the closed socket and finish.
    ioc_.restart();
    ioc_.run_for(std::chrono::milliseconds(500));

    if (process_) {
        terminate_chrome(*process_);
        process_.reset();
    }
}

auto CdpDriver::is_open() const -> bool {
    return process_.has_value() && page_ != nullptr;
}

// -- Navigation --

auto CdpDriver::navigate(std::string_view url) -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->navigate(url, options_.navigation_timeout_ms));
}

auto CdpDriver::reload() -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->reload(options_.navigation_timeout_ms));
}

auto CdpDriver::current_url() -> Result<std::string> {
    if (auto ok = require_open(); !ok) return std::unexpected(ok.error());
    return block_on(page_->current_url());
}

// -- Interaction --

auto CdpDriver::click(const Locator& locator, const ClickOptions& options) -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->click(locator, options));
}

auto CdpDriver::click_at(Point point, const ClickOptions& options) -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->click_at(point, options));
}

auto CdpDriver::fill(const Locator& locator, std::string_view text, const FillOptions& options)
    -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    if (options.sequential) {
        return block_on(page_->type(locator, text, options.delay_ms));
    }
    return block_on(page_->fill(locator, text));
}

auto CdpDriver::press(std::string_view key, const std::optional<Locator>& locator) -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->press(key, locator));
}

auto CdpDriver::hover(const Locator& locator) -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->hover(locator));
}

auto CdpDriver::check(const Locator& locator, bool assert_only) -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->check(locator, assert_only));
}

auto CdpDriver::select_options(const Locator& locator, const std::vector<SelectOption>& options)
    -> Result<std::vector<std::string>> {
    if (auto ok = require_open(); !ok) return std::unexpected(ok.error());
    return block_on(page_->select_options(locator, options));
}

auto CdpDriver::set_input_files(const Locator& locator, const std::vector<std::string>& files)
    -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->set_input_files(locator, files));
}

auto CdpDriver::focus(const Locator& locator) -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->focus(locator));
}

auto CdpDriver::scroll(const std::optional<Locator>& locator, ScrollMethod method, int dx, int dy)
    -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->scroll(locator, method, dx, dy));
}

auto CdpDriver::drag_and_drop(const Locator& source, const Locator& target) -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->drag_and_drop(source, target));
}

// -- Extraction --

auto CdpDriver::screenshot(const ScreenshotOptions& options) -> Result<std::string> {
    if (auto ok = require_open(); !ok) return std::unexpected(ok.error());
    auto data = block_on(page_->screenshot(options));
    if (!data) {
        return std::unexpected(data.error());
    }
    return utils::base64_decode(*data);
}

auto CdpDriver::wait_for_visible(const Locator& locator, int timeout_ms) -> VoidResult {
    if (auto ok = require_open(); !ok) return ok;
    return block_on(page_->wait_for_visible(locator, timeout_ms));
}

auto CdpDriver::inner_text(const Locator& locator) -> Result<std::string> {
    if (auto ok = require_open(); !ok) return std::unexpected(ok.error());
    return block_on(page_->inner_text(locator));
}

auto CdpDriver::evaluate(std::string_view expression) -> Result<json> {
    if (auto ok = require_open(); !ok) return std::unexpected(ok.error());
    auto result = block_on(page_->evaluate(expression));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exception) {
        return std::unexpected(make_error(ErrorCode::BrowserError, "Script execution failed",
                                          *result->exception));
    }
    return result->value;
}

auto CdpDriver::capture_requests(std::string_view url_fragment, const CaptureOptions& options)
    -> Result<std::optional<std::string>> {
    if (auto ok = require_open(); !ok) return std::unexpected(ok.error());
    return block_on(page_->capture_requests(url_fragment, options));
}

} // namespace pagewright::browser
