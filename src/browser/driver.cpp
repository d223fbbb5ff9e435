#include "pagewright/browser/driver.hpp"
#include "pagewright/core/utils.hpp"

namespace pagewright::browser {

auto LaunchOptions::from_config(const BrowserConfig& config) -> LaunchOptions {
    LaunchOptions options;
    options.headless = config.headless;
    options.chrome_path = config.chrome_path;
    options.debug_port = config.debug_port;
    options.launch_timeout_ms = config.launch_timeout_ms;
    options.navigation_timeout_ms = config.navigation_timeout_ms;
    options.viewport_width = config.viewport_width;
    options.viewport_height = config.viewport_height;
    options.extra_args = config.extra_args;
    return options;
}

auto scroll_method_from_string(std::string_view name) -> Result<ScrollMethod> {
    auto lowered = utils::to_lower(utils::trim(name));
    if (lowered.empty() || lowered == "evaluate") return ScrollMethod::Evaluate;
    if (lowered == "scroll_into_view") return ScrollMethod::ScrollIntoView;
    if (lowered == "mouse_wheel") return ScrollMethod::MouseWheel;
    if (lowered == "page_evaluate") return ScrollMethod::PageEvaluate;
    return std::unexpected(make_error(ErrorCode::InvalidArgument, "Unknown scrolling method",
                                      std::string(name)));
}

auto scroll_method_to_string(ScrollMethod method) -> std::string_view {
    switch (method) {
        case ScrollMethod::ScrollIntoView: return "scroll_into_view";
        case ScrollMethod::MouseWheel: return "mouse_wheel";
        case ScrollMethod::Evaluate: return "evaluate";
        case ScrollMethod::PageEvaluate: return "page_evaluate";
    }
    return "evaluate";
}

} // namespace pagewright::browser
