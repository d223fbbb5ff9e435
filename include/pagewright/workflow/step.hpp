#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "pagewright/browser/driver.hpp"
#include "pagewright/core/error.hpp"
#include "pagewright/workflow/context.hpp"

namespace pagewright::workflow {

using json = nlohmann::json;

// -- Browser steps --

/// Launches the browser; navigates to `url` when given.
struct OpenBrowserStep {
    std::optional<bool> headless;
    std::optional<std::string> url;
};

struct NavigateStep {
    std::string url;
};

/// Resolves a locator and stores it under `save_as` for later steps.
struct IdentifyStep {
    std::string save_as;
    json locator;
};

struct ClickStep {
    std::optional<ElementRef> target;
    std::optional<browser::Point> position;
    bool double_click = false;
    std::string button = "left";
};

struct FillStep {
    ElementRef target;
    std::string text;
    bool sequential = false;
    int delay_ms = 0;
};

struct PressKeyStep {
    std::optional<ElementRef> target;
    std::string key;
};

struct HoverStep {
    ElementRef target;
};

struct CheckStep {
    ElementRef target;
    bool assert_only = false;
};

struct SelectOptionsStep {
    ElementRef target;
    std::vector<browser::SelectOption> options;
};

struct UploadFilesStep {
    ElementRef target;
    std::vector<std::string> files;
};

struct FocusStep {
    ElementRef target;
};

struct ScrollStep {
    std::optional<ElementRef> target;
    browser::ScrollMethod method = browser::ScrollMethod::Evaluate;
    int dx = 0;
    int dy = 0;
};

struct DragAndDropStep {
    ElementRef source;
    ElementRef target;
};

struct ScreenshotStep {
    std::string file_path;
    bool full_page = false;
    std::optional<ElementRef> target;
};

struct WaitForElementStep {
    ElementRef target;
    int timeout_ms = 30000;
};

/// Pauses the run; the browser is not involved.
struct WaitForTimeStep {
    double seconds = 5.0;
};

struct CloseBrowserStep {};

/// Stores the URL of the first request containing `fragment` in
/// `vars[save_as]` (empty string when none was seen).
struct CaptureEndpointStep {
    std::string fragment = "components/?";
    bool reload = true;
    int wait_ms = 3000;
    std::string save_as = "endpoint";
};

/// Derives a new element from `target` through a JavaScript function and
/// saves it under `save_as`.
struct TransformElementStep {
    ElementRef target;
    std::string script;
    std::string save_as;
};

// -- Data steps --

/// Reads JSON from the element text (the page body by default), finds the
/// component whose task is `task` and stores it in `vars`.
struct ExtractComponentInfoStep {
    std::optional<ElementRef> source;
    std::string task;
};

/// Filters a component list down to one category. The list is read from
/// `vars[from]` when set, otherwise from the JSON text of the page body.
struct ExtractCategoryInfoStep {
    std::optional<std::string> from;
    std::string category;
    std::string save_as = "category_info";
};

/// Loads category_info, readme_template and screenshot_links from a file.
struct LoadCategoryDataStep {
    std::string file_path;
};

struct FetchReadmeTemplateStep {
    std::string url;
    std::string save_as = "readme_template";
};

/// Drafts a README from the category variables and writes it to
/// `output_path` (relative paths land in the output directory).
struct GenerateReadmeStep {
    std::string output_path = "README.md";
};

using Step = std::variant<OpenBrowserStep, NavigateStep, IdentifyStep, ClickStep, FillStep,
                          PressKeyStep, HoverStep, CheckStep, SelectOptionsStep, UploadFilesStep,
                          FocusStep, ScrollStep, DragAndDropStep, ScreenshotStep,
                          WaitForElementStep, WaitForTimeStep, CloseBrowserStep,
                          CaptureEndpointStep, TransformElementStep, ExtractComponentInfoStep,
                          ExtractCategoryInfoStep, LoadCategoryDataStep, FetchReadmeTemplateStep,
                          GenerateReadmeStep>;

struct Workflow {
    std::string name;
    json vars = json::object();
    std::vector<Step> steps;
};

/// Action name of a step ("click", "wait_for_time", ...).
auto step_kind(const Step& step) -> std::string_view;

/// Whether the step has to run on the browser worker.
auto is_driver_step(const Step& step) -> bool;

/// Parses one `{"action": "...", ...}` object, validating its parameters.
auto parse_step(const json& j) -> Result<Step>;

/// Parses `{"name": ..., "vars": {...}, "steps": [...]}`.
auto parse_workflow(const json& j) -> Result<Workflow>;

auto load_workflow(const std::filesystem::path& path) -> Result<Workflow>;

} // namespace pagewright::workflow
