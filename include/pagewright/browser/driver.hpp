#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "pagewright/browser/locator.hpp"
#include "pagewright/core/config.hpp"
#include "pagewright/core/error.hpp"

namespace pagewright::browser {

using json = nlohmann::json;

struct LaunchOptions {
    bool headless = false;
    std::optional<std::string> chrome_path;
    int debug_port = 9222;
    int launch_timeout_ms = 10000;
    int navigation_timeout_ms = 30000;
    int viewport_width = 1280;
    int viewport_height = 800;
    std::vector<std::string> extra_args;

    static auto from_config(const BrowserConfig& config) -> LaunchOptions;
};

struct Point {
    double x = 0;
    double y = 0;
};

struct ClickOptions {
    std::string button = "left";  // "left", "right", "middle"
    int click_count = 1;
    int delay_ms = 0;
    /// Offset from the element's top-left corner; the center when unset.
    std::optional<Point> position;
};

struct FillOptions {
    /// Type key by key instead of replacing the value in one go.
    bool sequential = false;
    int delay_ms = 0;
};

enum class ScrollMethod {
    ScrollIntoView,
    MouseWheel,
    Evaluate,
    PageEvaluate,
};

auto scroll_method_from_string(std::string_view name) -> Result<ScrollMethod>;
auto scroll_method_to_string(ScrollMethod method) -> std::string_view;

/// One option to pick in a <select>. With `by` unset the value matches
/// either an option's value or its label.
struct SelectOption {
    enum class By { Any, Value, Label, Index };

    By by = By::Any;
    std::string value;
};

struct ScreenshotOptions {
    std::string format = "png";  // "png" or "jpeg"
    int quality = 80;
    bool full_page = false;
    /// Captures only this element when set.
    std::optional<Locator> element;
};

struct CaptureOptions {
    bool reload = true;
    int wait_ms = 3000;
};

/// A single browser with one active page.
///
/// Implementations are thread-confined: a Driver is created, used and
/// destroyed on one thread. Every call is synchronous from the caller's
/// point of view.
class Driver {
public:
    virtual ~Driver() = default;

    // -- Lifecycle --

    virtual auto open(const LaunchOptions& options) -> VoidResult = 0;
    virtual auto close() -> VoidResult = 0;
    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    // -- Navigation --

    virtual auto navigate(std::string_view url) -> VoidResult = 0;
    virtual auto reload() -> VoidResult = 0;
    virtual auto current_url() -> Result<std::string> = 0;

    // -- Interaction --

    virtual auto click(const Locator& locator, const ClickOptions& options) -> VoidResult = 0;
    /// Clicks at viewport coordinates without targeting an element.
    virtual auto click_at(Point point, const ClickOptions& options) -> VoidResult = 0;
    virtual auto fill(const Locator& locator, std::string_view text,
                      const FillOptions& options) -> VoidResult = 0;
    /// Presses a key on the element, or on the page when `locator` is unset.
    virtual auto press(std::string_view key, const std::optional<Locator>& locator)
        -> VoidResult = 0;
    virtual auto hover(const Locator& locator) -> VoidResult = 0;
    /// Checks a checkbox or radio and verifies it ended up checked. With
    /// `assert_only` the element is not clicked, only verified.
    virtual auto check(const Locator& locator, bool assert_only) -> VoidResult = 0;
    virtual auto select_options(const Locator& locator, const std::vector<SelectOption>& options)
        -> Result<std::vector<std::string>> = 0;
    virtual auto set_input_files(const Locator& locator, const std::vector<std::string>& files)
        -> VoidResult = 0;
    virtual auto focus(const Locator& locator) -> VoidResult = 0;
    virtual auto scroll(const std::optional<Locator>& locator, ScrollMethod method, int dx,
                        int dy) -> VoidResult = 0;
    virtual auto drag_and_drop(const Locator& source, const Locator& target) -> VoidResult = 0;

    // -- Extraction --

    /// Returns the raw (decoded) image bytes.
    virtual auto screenshot(const ScreenshotOptions& options) -> Result<std::string> = 0;
    virtual auto wait_for_visible(const Locator& locator, int timeout_ms) -> VoidResult = 0;
    virtual auto inner_text(const Locator& locator) -> Result<std::string> = 0;
    virtual auto evaluate(std::string_view expression) -> Result<json> = 0;

    /// Watches network traffic and returns the URL of the first finished
    /// request containing `url_fragment`, if any.
    virtual auto capture_requests(std::string_view url_fragment, const CaptureOptions& options)
        -> Result<std::optional<std::string>> = 0;
};

} // namespace pagewright::browser
