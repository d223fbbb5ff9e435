#include "pagewright/workflow/step.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"

#include <array>
#include <fstream>
#include <sstream>
#include <utility>

namespace pagewright::workflow {

namespace {

constexpr double kMaxWaitSeconds = 24 * 60 * 60;

constexpr std::string_view kMissingLocator =
    "Must provide at least one locator method (selector, role, or label)";

auto invalid(std::string_view action, std::string message) -> Error {
    return make_error(ErrorCode::InvalidArgument, std::move(message), std::string(action));
}

/// Non-empty string parameter, or an error naming the step.
auto required_string(const json& j, const char* key, std::string_view action)
    -> Result<std::string> {
    auto value = j.value(key, std::string{});
    if (utils::trim(value).empty()) {
        return std::unexpected(invalid(action, std::string("'") + key + "' must be provided"));
    }
    return value;
}

auto optional_string(const json& j, const char* key) -> std::optional<std::string> {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

/// Reads an element reference from a step object: a saved `element`, an
/// inline `locator` (a CSS string or locator object) or top-level
/// selector/role/label keys.
auto element_ref_from(const json& j) -> std::optional<ElementRef> {
    if (auto name = optional_string(j, "element")) {
        return ElementRef{.element = std::move(name), .locator = nullptr};
    }
    if (j.contains("locator") && !j["locator"].is_null()) {
        return ElementRef{.element = std::nullopt, .locator = j["locator"]};
    }

    json inline_locator = json::object();
    for (const auto* key : {"selector", "role", "name", "label", "transforms"}) {
        if (j.contains(key) && !j[key].is_null()) {
            inline_locator[key] = j[key];
        }
    }
    if (inline_locator.contains("selector") || inline_locator.contains("role") ||
        inline_locator.contains("label")) {
        return ElementRef{.element = std::nullopt, .locator = std::move(inline_locator)};
    }
    return std::nullopt;
}

auto require_element(const json& j, std::string_view action) -> Result<ElementRef> {
    auto ref = element_ref_from(j);
    if (!ref) {
        return std::unexpected(invalid(action, std::string(kMissingLocator)));
    }
    return std::move(*ref);
}

/// `source`/`target` of drag_and_drop: a saved element name or a locator
/// object.
auto element_ref_value(const json& v, std::string_view action, const char* key)
    -> Result<ElementRef> {
    if (v.is_string() && !v.get<std::string>().empty()) {
        return ElementRef{.element = v.get<std::string>(), .locator = nullptr};
    }
    if (v.is_object()) {
        if (auto ref = element_ref_from(v)) {
            return std::move(*ref);
        }
    }
    return std::unexpected(invalid(action, std::string("Missing ") + key + " locator"));
}

// -- Per-action parsers --

auto parse_open_browser(const json& j) -> Result<Step> {
    OpenBrowserStep step;
    if (j.contains("headless") && !j["headless"].is_null()) {
        step.headless = j["headless"].get<bool>();
    }
    step.url = optional_string(j, "url");
    return step;
}

auto parse_navigate(const json& j) -> Result<Step> {
    auto url = required_string(j, "url", "navigate");
    if (!url) return std::unexpected(url.error());
    return NavigateStep{std::move(*url)};
}

auto parse_identify(const json& j) -> Result<Step> {
    auto save_as = required_string(j, "save_as", "identify");
    if (!save_as) return std::unexpected(save_as.error());

    auto ref = element_ref_from(j);
    if (!ref || ref->element) {
        return std::unexpected(invalid("identify", std::string(kMissingLocator)));
    }
    return IdentifyStep{std::move(*save_as), std::move(ref->locator)};
}

auto parse_click(const json& j) -> Result<Step> {
    ClickStep step;
    step.target = element_ref_from(j);
    step.double_click = j.value("double_click", false);
    step.button = j.value("button", std::string("left"));

    if (j.contains("position") && j["position"].is_object() && !j["position"].empty()) {
        const auto& pos = j["position"];
        if (!pos.contains("x") || !pos.contains("y")) {
            return std::unexpected(invalid("click", "'position' needs both 'x' and 'y'"));
        }
        step.position = browser::Point{pos["x"].get<double>(), pos["y"].get<double>()};
    }
    if (!step.target && !step.position) {
        return std::unexpected(
            invalid("click", "You must provide either a locator or a valid position"));
    }
    return step;
}

auto parse_fill(const json& j) -> Result<Step> {
    auto target = require_element(j, "fill");
    if (!target) return std::unexpected(target.error());
    if (!j.contains("text") || !j["text"].is_string()) {
        return std::unexpected(invalid("fill", "'text' must be provided"));
    }
    return FillStep{
        .target = std::move(*target),
        .text = j["text"].get<std::string>(),
        .sequential = j.value("sequential", false),
        .delay_ms = j.value("delay", 0),
    };
}

auto parse_press_key(const json& j) -> Result<Step> {
    auto key = required_string(j, "key", "press_key");
    if (!key) return std::unexpected(key.error());
    return PressKeyStep{element_ref_from(j), std::move(*key)};
}

auto parse_hover(const json& j) -> Result<Step> {
    auto target = require_element(j, "hover");
    if (!target) return std::unexpected(target.error());
    return HoverStep{std::move(*target)};
}

auto parse_check(const json& j) -> Result<Step> {
    auto target = require_element(j, "check");
    if (!target) return std::unexpected(target.error());
    return CheckStep{std::move(*target), j.value("to_be_checked", false)};
}

auto parse_select_options(const json& j) -> Result<Step> {
    auto target = require_element(j, "select_options");
    if (!target) return std::unexpected(target.error());

    if (!j.contains("options") || !j["options"].is_array() || j["options"].empty()) {
        return std::unexpected(invalid("select_options", "'options' must be a non-empty list"));
    }

    auto by_name = utils::to_lower(j.value("by", std::string{}));
    auto by = browser::SelectOption::By::Any;
    if (by_name == "value") {
        by = browser::SelectOption::By::Value;
    } else if (by_name == "label") {
        by = browser::SelectOption::By::Label;
    } else if (by_name == "index") {
        by = browser::SelectOption::By::Index;
    } else if (!by_name.empty()) {
        return std::unexpected(invalid("select_options", "Unknown 'by' value: " + by_name));
    }

    SelectOptionsStep step{std::move(*target), {}};
    for (const auto& option : j["options"]) {
        auto value = option.is_string() ? option.get<std::string>() : option.dump();
        step.options.push_back({by, std::move(value)});
    }
    return step;
}

auto parse_upload_files(const json& j) -> Result<Step> {
    auto target = require_element(j, "upload_files");
    if (!target) return std::unexpected(target.error());
    if (!j.contains("files") || !j["files"].is_array() || j["files"].empty()) {
        return std::unexpected(invalid("upload_files", "'files' must be a non-empty list"));
    }
    return UploadFilesStep{std::move(*target), j["files"].get<std::vector<std::string>>()};
}

auto parse_focus(const json& j) -> Result<Step> {
    auto target = require_element(j, "focus");
    if (!target) return std::unexpected(target.error());
    return FocusStep{std::move(*target)};
}

auto parse_scroll(const json& j) -> Result<Step> {
    auto method = browser::scroll_method_from_string(j.value("method", std::string{}));
    if (!method) return std::unexpected(method.error());

    ScrollStep step{element_ref_from(j), *method, j.value("x", 0), j.value("y", 0)};
    if (step.method == browser::ScrollMethod::ScrollIntoView && !step.target) {
        return std::unexpected(invalid("scroll", "'scroll_into_view' method requires a locator"));
    }
    return step;
}

auto parse_drag_and_drop(const json& j) -> Result<Step> {
    auto source = element_ref_value(j.value("source", json()), "drag_and_drop", "source");
    if (!source) return std::unexpected(source.error());
    auto target = element_ref_value(j.value("target", json()), "drag_and_drop", "target");
    if (!target) return std::unexpected(target.error());
    return DragAndDropStep{std::move(*source), std::move(*target)};
}

auto parse_screenshot(const json& j) -> Result<Step> {
    auto path = required_string(j, "file_path", "screenshot");
    if (!path) return std::unexpected(path.error());
    return ScreenshotStep{std::move(*path), j.value("full_page", false), element_ref_from(j)};
}

auto parse_wait_for_element(const json& j) -> Result<Step> {
    auto target = require_element(j, "wait_for_element");
    if (!target) return std::unexpected(target.error());
    auto timeout = j.value("timeout", 30000);
    if (timeout <= 0) {
        return std::unexpected(invalid("wait_for_element", "'timeout' must be positive"));
    }
    return WaitForElementStep{std::move(*target), timeout};
}

auto parse_wait_for_time(const json& j) -> Result<Step> {
    auto seconds = j.value("time_in_seconds", 5.0);
    if (seconds < 0) {
        return std::unexpected(invalid("wait_for_time", "'time_in_seconds' must not be negative"));
    }
    if (seconds > kMaxWaitSeconds) {
        return std::unexpected(invalid("wait_for_time", "'time_in_seconds' must not exceed 86400"));
    }
    return WaitForTimeStep{seconds};
}

auto parse_close_browser(const json&) -> Result<Step> {
    return CloseBrowserStep{};
}

auto parse_capture_endpoint(const json& j) -> Result<Step> {
    CaptureEndpointStep step;
    step.fragment = j.value("fragment", step.fragment);
    step.reload = j.value("reload_page", step.reload);
    step.wait_ms = j.value("wait", step.wait_ms);
    step.save_as = j.value("save_as", step.save_as);
    if (step.fragment.empty()) {
        return std::unexpected(invalid("capture_endpoint", "'fragment' must not be empty"));
    }
    return step;
}

auto parse_transform_element(const json& j) -> Result<Step> {
    auto target = require_element(j, "transform_element");
    if (!target) return std::unexpected(target.error());
    auto script = required_string(j, "js_script", "transform_element");
    if (!script) return std::unexpected(script.error());
    auto save_as = required_string(j, "save_as", "transform_element");
    if (!save_as) return std::unexpected(save_as.error());
    return TransformElementStep{std::move(*target), std::move(*script), std::move(*save_as)};
}

auto parse_extract_component_info(const json& j) -> Result<Step> {
    auto name = required_string(j, "component_name", "extract_component_info");
    if (!name) return std::unexpected(name.error());
    return ExtractComponentInfoStep{element_ref_from(j), std::move(*name)};
}

auto parse_extract_category_info(const json& j) -> Result<Step> {
    auto category = required_string(j, "category", "extract_category_info");
    if (!category) return std::unexpected(category.error());
    ExtractCategoryInfoStep step;
    step.from = optional_string(j, "from");
    step.category = std::move(*category);
    step.save_as = j.value("save_as", step.save_as);
    return step;
}

auto parse_load_category_data(const json& j) -> Result<Step> {
    auto path = required_string(j, "file_path", "load_category_data");
    if (!path) return std::unexpected(path.error());
    return LoadCategoryDataStep{std::move(*path)};
}

auto parse_fetch_readme_template(const json& j) -> Result<Step> {
    auto url = required_string(j, "url", "fetch_readme_template");
    if (!url) return std::unexpected(url.error());
    FetchReadmeTemplateStep step;
    step.url = std::move(*url);
    step.save_as = j.value("save_as", step.save_as);
    return step;
}

auto parse_generate_readme(const json& j) -> Result<Step> {
    GenerateReadmeStep step;
    step.output_path = j.value("output_path", step.output_path);
    if (step.output_path.empty()) {
        return std::unexpected(invalid("generate_readme", "'output_path' must not be empty"));
    }
    return step;
}

using StepParser = auto (*)(const json&) -> Result<Step>;

constexpr std::array<std::pair<std::string_view, StepParser>, 24> kParsers{{
    {"open_browser", parse_open_browser},
    {"navigate", parse_navigate},
    {"identify", parse_identify},
    {"click", parse_click},
    {"fill", parse_fill},
    {"press_key", parse_press_key},
    {"hover", parse_hover},
    {"check", parse_check},
    {"select_options", parse_select_options},
    {"upload_files", parse_upload_files},
    {"focus", parse_focus},
    {"scroll", parse_scroll},
    {"drag_and_drop", parse_drag_and_drop},
    {"screenshot", parse_screenshot},
    {"wait_for_element", parse_wait_for_element},
    {"wait_for_time", parse_wait_for_time},
    {"close_browser", parse_close_browser},
    {"capture_endpoint", parse_capture_endpoint},
    {"transform_element", parse_transform_element},
    {"extract_component_info", parse_extract_component_info},
    {"extract_category_info", parse_extract_category_info},
    {"load_category_data", parse_load_category_data},
    {"fetch_readme_template", parse_fetch_readme_template},
    {"generate_readme", parse_generate_readme},
}};

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // anonymous namespace

auto step_kind(const Step& step) -> std::string_view {
    // kParsers lists the actions in variant order.
    return kParsers[step.index()].first;
}

auto is_driver_step(const Step& step) -> bool {
    return std::visit(
        overloaded{
            [](const IdentifyStep&) { return false; },
            [](const WaitForTimeStep&) { return false; },
            [](const LoadCategoryDataStep&) { return false; },
            [](const FetchReadmeTemplateStep&) { return false; },
            [](const GenerateReadmeStep&) { return false; },
            [](const ExtractCategoryInfoStep& s) { return !s.from.has_value(); },
            [](const auto&) { return true; },
        },
        step);
}

auto parse_step(const json& j) -> Result<Step> {
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Workflow step must be an object", j.dump()));
    }
    auto action = j.value("action", std::string{});
    if (action.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Workflow step is missing 'action'", j.dump()));
    }

    for (const auto& [name, parser] : kParsers) {
        if (name != action) {
            continue;
        }
        try {
            return parser(j);
        } catch (const json::exception& e) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Invalid parameter type", action + ": " + e.what()));
        }
    }
    return std::unexpected(make_error(ErrorCode::InvalidArgument, "Unknown workflow action",
                                      action));
}

auto parse_workflow(const json& j) -> Result<Workflow> {
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Workflow must be a JSON object"));
    }
    if (!j.contains("steps") || !j["steps"].is_array()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Workflow must have a 'steps' list"));
    }

    Workflow workflow;
    workflow.name = j.value("name", std::string("workflow"));
    if (j.contains("vars")) {
        if (!j["vars"].is_object()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Workflow 'vars' must be an object"));
        }
        workflow.vars = j["vars"];
    }

    std::size_t index = 0;
    for (const auto& item : j["steps"]) {
        auto step = parse_step(item);
        if (!step) {
            const auto& err = step.error();
            return std::unexpected(make_error(
                err.code(), std::string(err.message()),
                "step " + std::to_string(index) + ": " + std::string(err.detail())));
        }
        workflow.steps.push_back(std::move(*step));
        ++index;
    }
    return workflow;
}

auto load_workflow(const std::filesystem::path& path) -> Result<Workflow> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::NotFound, "Cannot open workflow file",
                                          path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Workflow file is not valid JSON", path.string()));
    }

    auto workflow = parse_workflow(j);
    if (workflow) {
        LOG_DEBUG("Loaded workflow '{}' ({} steps) from {}", workflow->name,
                  workflow->steps.size(), path.string());
    }
    return workflow;
}

} // namespace pagewright::workflow
