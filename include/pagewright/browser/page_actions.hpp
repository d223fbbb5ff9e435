#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

#include "pagewright/browser/cdp_client.hpp"
#include "pagewright/browser/driver.hpp"
#include "pagewright/browser/locator.hpp"
#include "pagewright/core/error.hpp"

namespace pagewright::browser {

using boost::asio::awaitable;
using json = nlohmann::json;

/// Result of evaluating JavaScript in the browser context.
struct EvalResult {
    json value;
    std::optional<std::string> exception;
};

/// Page coordinates and size of an element.
struct ElementBox {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    [[nodiscard]] auto center() const -> Point { return {x + width / 2.0, y + height / 2.0}; }
};

/// DOM key description used for Input.dispatchKeyEvent.
struct KeyDefinition {
    std::string key;
    std::string code;
    int key_code = 0;
    std::string text;
};

/// Looks up a key name ("Enter", "ArrowDown", "a", "F5"...). Unknown names
/// give nullopt.
auto key_definition(std::string_view name) -> std::optional<KeyDefinition>;

/// CDP modifier bit for "Alt", "Control", "Meta" or "Shift"; 0 otherwise.
auto modifier_bit(std::string_view name) -> int;

/// Tracks network requests and remembers the most recently finished one
/// whose URL contains the fragment.
class RequestCapture {
public:
    explicit RequestCapture(std::string fragment) : fragment_(std::move(fragment)) {}

    /// Network.requestWillBeSent
    void on_request(const json& params);
    /// Network.loadingFinished; a later match replaces an earlier one.
    void on_finished(const json& params);

    [[nodiscard]] auto captured() const -> const std::optional<std::string>& {
        return captured_;
    }

private:
    std::string fragment_;
    std::unordered_map<std::string, std::string> urls_;
    std::optional<std::string> captured_;
};

/// Browser automation actions over one CDP page session.
/// Elements are addressed by Locator and re-resolved on every call.
class PageActions {
public:
    explicit PageActions(CdpClient& cdp);

    // -- Navigation --

    auto navigate(std::string_view url, int timeout_ms) -> awaitable<Result<void>>;
    auto reload(int timeout_ms) -> awaitable<Result<void>>;
    auto current_url() -> awaitable<Result<std::string>>;

    // -- Interaction --

    auto click(const Locator& locator, const ClickOptions& options) -> awaitable<Result<void>>;
    auto click_at(Point point, const ClickOptions& options) -> awaitable<Result<void>>;
    auto fill(const Locator& locator, std::string_view text) -> awaitable<Result<void>>;
    auto type(const Locator& locator, std::string_view text, int delay_ms)
        -> awaitable<Result<void>>;
    auto press(std::string_view key, const std::optional<Locator>& locator)
        -> awaitable<Result<void>>;
    auto hover(const Locator& locator) -> awaitable<Result<void>>;
    auto is_checked(const Locator& locator) -> awaitable<Result<bool>>;
    auto check(const Locator& locator, bool assert_only) -> awaitable<Result<void>>;
    auto select_options(const Locator& locator, const std::vector<SelectOption>& options)
        -> awaitable<Result<std::vector<std::string>>>;
    auto set_input_files(const Locator& locator, const std::vector<std::string>& files)
        -> awaitable<Result<void>>;
    auto focus(const Locator& locator) -> awaitable<Result<void>>;
    auto scroll(const std::optional<Locator>& locator, ScrollMethod method, int dx, int dy)
        -> awaitable<Result<void>>;
    auto drag_and_drop(const Locator& source, const Locator& target) -> awaitable<Result<void>>;

    // -- Extraction --

    /// Base64-encoded image data as returned by Page.captureScreenshot.
    auto screenshot(const ScreenshotOptions& options) -> awaitable<Result<std::string>>;
    auto inner_text(const Locator& locator) -> awaitable<Result<std::string>>;
    auto element_box(const Locator& locator) -> awaitable<Result<ElementBox>>;

    // -- JavaScript --

    auto evaluate(std::string_view expression) -> awaitable<Result<EvalResult>>;

    // -- Waiting --

    auto wait_for_visible(const Locator& locator, int timeout_ms, int polling_ms = 100)
        -> awaitable<Result<void>>;
    auto wait(int ms) -> awaitable<void>;

    // -- Network --

    auto capture_requests(std::string_view url_fragment, const CaptureOptions& options)
        -> awaitable<Result<std::optional<std::string>>>;

private:
    /// Runs `function_js` (a JS function taking the element) against the
    /// resolved element and returns its by-value result. NotFound when the
    /// locator matches nothing.
    auto call_on_element(const Locator& locator, std::string_view function_js)
        -> awaitable<Result<json>>;
    auto visible_point(const Locator& locator, const std::optional<Point>& offset)
        -> awaitable<Result<Point>>;
    auto dispatch_mouse_event(std::string_view type, Point point, std::string_view button,
                              int click_count) -> awaitable<Result<void>>;
    auto dispatch_key(const KeyDefinition& key, int modifiers) -> awaitable<Result<void>>;
    auto insert_char(std::string_view text) -> awaitable<Result<void>>;
    auto wait_for_load(std::shared_ptr<bool> loaded, int timeout_ms) -> awaitable<Result<void>>;

    CdpClient& cdp_;
    Point mouse_{};
};

} // namespace pagewright::browser
