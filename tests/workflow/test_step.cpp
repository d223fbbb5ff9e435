#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "pagewright/workflow/step.hpp"

using namespace pagewright;
using namespace pagewright::workflow;

namespace {

template <typename T>
auto parse_as(const json& j) -> T {
    auto step = parse_step(j);
    REQUIRE(step.has_value());
    REQUIRE(std::holds_alternative<T>(*step));
    return std::get<T>(*step);
}

auto parse_error(const json& j) -> Error {
    auto step = parse_step(j);
    REQUIRE_FALSE(step.has_value());
    return step.error();
}

} // namespace

TEST_CASE("Every action parses to its step kind", "[workflow][step]") {
    json steps = json::array({
        {{"action", "open_browser"}},
        {{"action", "navigate"}, {"url", "https://example.com"}},
        {{"action", "identify"}, {"save_as", "btn"}, {"selector", "#b"}},
        {{"action", "click"}, {"selector", "#b"}},
        {{"action", "fill"}, {"selector", "#q"}, {"text", "hi"}},
        {{"action", "press_key"}, {"key", "Enter"}},
        {{"action", "hover"}, {"element", "btn"}},
        {{"action", "check"}, {"label", "Agree"}},
        {{"action", "select_options"}, {"selector", "select"}, {"options", {"a"}}},
        {{"action", "upload_files"}, {"selector", "input"}, {"files", {"a.txt"}}},
        {{"action", "focus"}, {"selector", "#q"}},
        {{"action", "scroll"}},
        {{"action", "drag_and_drop"}, {"source", "a"}, {"target", "b"}},
        {{"action", "screenshot"}, {"file_path", "shot.png"}},
        {{"action", "wait_for_element"}, {"selector", "#q"}},
        {{"action", "wait_for_time"}},
        {{"action", "close_browser"}},
        {{"action", "capture_endpoint"}},
        {{"action", "transform_element"}, {"element", "btn"}, {"js_script", "n => n"},
         {"save_as", "parent"}},
        {{"action", "extract_component_info"}, {"component_name", "PlaywrightClick"}},
        {{"action", "extract_category_info"}, {"category", "PLAYWRIGHT"}},
        {{"action", "load_category_data"}, {"file_path", "data.json"}},
        {{"action", "fetch_readme_template"}, {"url", "https://example.com/t.md"}},
        {{"action", "generate_readme"}},
    });

    for (std::size_t i = 0; i < steps.size(); ++i) {
        auto step = parse_step(steps[i]);
        INFO(steps[i].dump());
        REQUIRE(step.has_value());
        CHECK(step->index() == i);
        CHECK(step_kind(*step) == steps[i]["action"].get<std::string>());
    }
}

TEST_CASE("Driver and data steps are told apart", "[workflow][step]") {
    CHECK(is_driver_step(NavigateStep{"https://a"}));
    CHECK(is_driver_step(CloseBrowserStep{}));
    CHECK(is_driver_step(ExtractComponentInfoStep{}));
    CHECK(is_driver_step(ExtractCategoryInfoStep{}));

    CHECK_FALSE(is_driver_step(IdentifyStep{}));
    CHECK_FALSE(is_driver_step(WaitForTimeStep{}));
    CHECK_FALSE(is_driver_step(LoadCategoryDataStep{}));
    CHECK_FALSE(is_driver_step(FetchReadmeTemplateStep{}));
    CHECK_FALSE(is_driver_step(GenerateReadmeStep{}));

    ExtractCategoryInfoStep from_vars;
    from_vars.from = "components";
    CHECK_FALSE(is_driver_step(from_vars));
}

TEST_CASE("Element references come from element, locator or inline keys", "[workflow][step]") {
    auto saved = parse_as<HoverStep>({{"action", "hover"}, {"element", "menu"}});
    CHECK(saved.target.element == std::optional<std::string>("menu"));

    auto css = parse_as<HoverStep>({{"action", "hover"}, {"locator", "#menu"}});
    CHECK(css.target.locator == "#menu");

    auto role = parse_as<HoverStep>(
        {{"action", "hover"}, {"role", "button"}, {"name", "Go"}, {"transforms", {"n => n"}}});
    CHECK(role.target.locator ==
          json{{"role", "button"}, {"name", "Go"}, {"transforms", {"n => n"}}});
}

TEST_CASE("Click accepts a position instead of a locator", "[workflow][step]") {
    auto click = parse_as<ClickStep>(
        {{"action", "click"}, {"position", {{"x", 10}, {"y", 20.5}}}, {"double_click", true},
         {"button", "right"}});
    CHECK_FALSE(click.target.has_value());
    REQUIRE(click.position.has_value());
    CHECK(click.position->x == 10);
    CHECK(click.position->y == 20.5);
    CHECK(click.double_click);
    CHECK(click.button == "right");

    auto none = parse_error({{"action", "click"}});
    CHECK(none.message() == "You must provide either a locator or a valid position");
    CHECK(none.detail() == "click");

    CHECK_FALSE(parse_step({{"action", "click"}, {"position", {{"x", 1}}}}).has_value());
}

TEST_CASE("Fill options", "[workflow][step]") {
    auto fill = parse_as<FillStep>({{"action", "fill"}, {"selector", "#q"}, {"text", ""},
                                    {"sequential", true}, {"delay", 50}});
    CHECK(fill.text.empty());
    CHECK(fill.sequential);
    CHECK(fill.delay_ms == 50);

    CHECK(parse_error({{"action", "fill"}, {"selector", "#q"}}).message() ==
          "'text' must be provided");
    CHECK(parse_error({{"action", "fill"}, {"text", "x"}}).message() ==
          "Must provide at least one locator method (selector, role, or label)");
}

TEST_CASE("Required string parameters must be non-blank", "[workflow][step]") {
    auto err = parse_error({{"action", "press_key"}, {"key", "  "}});
    CHECK(err.code() == ErrorCode::InvalidArgument);
    CHECK(err.message() == "'key' must be provided");
    CHECK(err.detail() == "press_key");

    CHECK(parse_error({{"action", "navigate"}}).message() == "'url' must be provided");
    CHECK(parse_error({{"action", "screenshot"}}).message() == "'file_path' must be provided");
}

TEST_CASE("Select options honour the match mode", "[workflow][step]") {
    auto by_index = parse_as<SelectOptionsStep>(
        {{"action", "select_options"}, {"selector", "select"}, {"options", {0, 2}},
         {"by", "index"}});
    REQUIRE(by_index.options.size() == 2);
    CHECK(by_index.options[1].by == browser::SelectOption::By::Index);
    CHECK(by_index.options[1].value == "2");

    auto any = parse_as<SelectOptionsStep>(
        {{"action", "select_options"}, {"selector", "select"}, {"options", {"red"}}});
    CHECK(any.options[0].by == browser::SelectOption::By::Any);

    CHECK_FALSE(parse_step({{"action", "select_options"}, {"selector", "s"},
                            {"options", {"a"}}, {"by", "colour"}})
                    .has_value());
    CHECK_FALSE(parse_step({{"action", "select_options"}, {"selector", "s"},
                            {"options", json::array()}})
                    .has_value());
}

TEST_CASE("Scroll methods", "[workflow][step]") {
    auto wheel = parse_as<ScrollStep>(
        {{"action", "scroll"}, {"method", "mouse_wheel"}, {"x", 0}, {"y", 400}});
    CHECK(wheel.method == browser::ScrollMethod::MouseWheel);
    CHECK(wheel.dy == 400);

    auto err = parse_error({{"action", "scroll"}, {"method", "scroll_into_view"}});
    CHECK(err.message() == "'scroll_into_view' method requires a locator");

    CHECK_FALSE(parse_step({{"action", "scroll"}, {"method", "sideways"}}).has_value());
}

TEST_CASE("Drag and drop takes names or locator objects", "[workflow][step]") {
    auto step = parse_as<DragAndDropStep>(
        {{"action", "drag_and_drop"}, {"source", "card"}, {"target", {{"selector", "#lane2"}}}});
    CHECK(step.source.element == std::optional<std::string>("card"));
    CHECK(step.target.locator == json{{"selector", "#lane2"}});

    auto err = parse_error({{"action", "drag_and_drop"}, {"source", "card"}});
    CHECK(err.message() == "Missing target locator");
}

TEST_CASE("Step defaults", "[workflow][step]") {
    auto wait = parse_as<WaitForElementStep>({{"action", "wait_for_element"}, {"selector", "x"}});
    CHECK(wait.timeout_ms == 30000);

    auto pause = parse_as<WaitForTimeStep>({{"action", "wait_for_time"}});
    CHECK(pause.seconds == 5.0);

    auto capture = parse_as<CaptureEndpointStep>({{"action", "capture_endpoint"}});
    CHECK(capture.fragment == "components/?");
    CHECK(capture.reload);
    CHECK(capture.wait_ms == 3000);
    CHECK(capture.save_as == "endpoint");

    auto category = parse_as<ExtractCategoryInfoStep>(
        {{"action", "extract_category_info"}, {"category", "X"}});
    CHECK(category.save_as == "category_info");
    CHECK_FALSE(category.from.has_value());

    auto readme = parse_as<GenerateReadmeStep>({{"action", "generate_readme"}});
    CHECK(readme.output_path == "README.md");

    CHECK_FALSE(parse_step({{"action", "wait_for_element"}, {"selector", "x"}, {"timeout", 0}})
                    .has_value());
    CHECK_FALSE(parse_step({{"action", "wait_for_time"}, {"time_in_seconds", -1}}).has_value());
    CHECK_FALSE(parse_step({{"action", "wait_for_time"}, {"time_in_seconds", 1e300}}).has_value());
    CHECK(parse_step({{"action", "wait_for_time"}, {"time_in_seconds", 86400}}).has_value());
}

TEST_CASE("Malformed steps are rejected", "[workflow][step]") {
    CHECK(parse_error(json::array()).message() == "Workflow step must be an object");
    CHECK(parse_error({{"url", "x"}}).message() == "Workflow step is missing 'action'");

    auto unknown = parse_error({{"action", "teleport"}});
    CHECK(unknown.message() == "Unknown workflow action");
    CHECK(unknown.detail() == "teleport");

    auto wrong_type = parse_error({{"action", "fill"}, {"selector", "#q"}, {"text", "x"},
                                   {"sequential", "yes"}});
    CHECK(wrong_type.message() == "Invalid parameter type");
}

TEST_CASE("Workflows carry name, vars and steps", "[workflow][step]") {
    auto workflow = parse_workflow({
        {"name", "docs"},
        {"vars", {{"base", "https://example.com"}}},
        {"steps", {{{"action", "open_browser"}, {"url", "{base}"}},
                   {{"action", "close_browser"}}}},
    });
    REQUIRE(workflow.has_value());
    CHECK(workflow->name == "docs");
    CHECK(workflow->vars["base"] == "https://example.com");
    CHECK(workflow->steps.size() == 2);

    auto unnamed = parse_workflow({{"steps", json::array()}});
    REQUIRE(unnamed.has_value());
    CHECK(unnamed->name == "workflow");
}

TEST_CASE("Workflow errors name the failing step", "[workflow][step]") {
    auto bad = parse_workflow({{"steps", {{{"action", "close_browser"}},
                                          {{"action", "navigate"}}}}});
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().detail() == "step 1: navigate");

    CHECK_FALSE(parse_workflow({{"name", "x"}}).has_value());
    CHECK_FALSE(parse_workflow({{"steps", json::array()}, {"vars", json::array()}}).has_value());
}

TEST_CASE("Workflows load from disk", "[workflow][step]") {
    auto dir = std::filesystem::temp_directory_path() / "pagewright_step_test";
    std::filesystem::create_directories(dir);

    auto good = dir / "good.json";
    std::ofstream(good) << R"({"name": "w", "steps": [{"action": "wait_for_time", "time_in_seconds": 0}]})";
    auto loaded = load_workflow(good);
    REQUIRE(loaded.has_value());
    CHECK(loaded->steps.size() == 1);

    auto broken = dir / "broken.json";
    std::ofstream(broken) << "{ not json";
    auto parse_failed = load_workflow(broken);
    REQUIRE_FALSE(parse_failed.has_value());
    CHECK(parse_failed.error().code() == ErrorCode::SerializationError);

    auto missing = load_workflow(dir / "missing.json");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == ErrorCode::NotFound);

    std::filesystem::remove_all(dir);
}
