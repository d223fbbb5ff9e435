#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "pagewright/browser/cdp_client.hpp"
#include "pagewright/browser/chrome_launcher.hpp"
#include "pagewright/browser/driver.hpp"
#include "pagewright/browser/page_actions.hpp"

namespace pagewright::browser {

/// Driver backed by a locally launched Chrome over the DevTools protocol.
///
/// The driver owns a private io_context. Each call runs its CDP coroutine
/// to completion on the calling thread, so the driver must stay on the
/// thread that created it.
class CdpDriver final : public Driver {
public:
    CdpDriver();
    ~CdpDriver() override;

    CdpDriver(const CdpDriver&) = delete;
    CdpDriver& operator=(const CdpDriver&) = delete;

    auto open(const LaunchOptions& options) -> VoidResult override;
    auto close() -> VoidResult override;
    [[nodiscard]] auto is_open() const -> bool override;

    auto navigate(std::string_view url) -> VoidResult override;
    auto reload() -> VoidResult override;
    auto current_url() -> Result<std::string> override;

    auto click(const Locator& locator, const ClickOptions& options) -> VoidResult override;
    auto click_at(Point point, const ClickOptions& options) -> VoidResult override;
    auto fill(const Locator& locator, std::string_view text, const FillOptions& options)
        -> VoidResult override;
    auto press(std::string_view key, const std::optional<Locator>& locator)
        -> VoidResult override;
    auto hover(const Locator& locator) -> VoidResult override;
    auto check(const Locator& locator, bool assert_only) -> VoidResult override;
    auto select_options(const Locator& locator, const std::vector<SelectOption>& options)
        -> Result<std::vector<std::string>> override;
    auto set_input_files(const Locator& locator, const std::vector<std::string>& files)
        -> VoidResult override;
    auto focus(const Locator& locator) -> VoidResult override;
    auto scroll(const std::optional<Locator>& locator, ScrollMethod method, int dx, int dy)
        -> VoidResult override;
    auto drag_and_drop(const Locator& source, const Locator& target) -> VoidResult override;

    auto screenshot(const ScreenshotOptions& options) -> Result<std::string> override;
    auto wait_for_visible(const Locator& locator, int timeout_ms) -> VoidResult override;
    auto inner_text(const Locator& locator) -> Result<std::string> override;
    auto evaluate(std::string_view expression) -> Result<json> override;

    auto capture_requests(std::string_view url_fragment, const CaptureOptions& options)
        -> Result<std::optional<std::string>> override;

private:
    template <typename T>
    auto block_on(boost::asio::awaitable<Result<T>> op) -> Result<T>;

    auto require_open() const -> VoidResult;
    auto connect_page() -> awaitable<Result<void>>;
    void shutdown();

    boost::asio::io_context ioc_;
    std::optional<ChromeProcess> process_;
    std::unique_ptr<CdpClient> cdp_;
    std::unique_ptr<PageActions> page_;
    LaunchOptions options_;
};

} // namespace pagewright::browser
