#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "pagewright/core/utils.hpp"
#include "pagewright/executor/host.hpp"
#include "pagewright/workflow/runner.hpp"
#include "support/fake_driver.hpp"
#include "support/fake_provider.hpp"
#include "support/run_sync.hpp"

using namespace pagewright;
using namespace pagewright::workflow;

namespace {

namespace fs = std::filesystem;

auto read_text(const fs::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// One fake browser worker plus a runner writing into a scratch directory.
class RunnerHarness {
public:
    RunnerHarness()
        : state(std::make_shared<FakeBrowserState>()),
          output_dir(fs::temp_directory_path() / ("pagewright_runner_" + utils::generate_id(8))),
          host_([state = state]() -> Result<std::unique_ptr<browser::Driver>> {
              return std::make_unique<FakeDriver>(state);
          }, "fake-browser"),
          runner_(ioc_, dispatcher(), options()) {}

    ~RunnerHarness() {
        std::error_code ec;
        fs::remove_all(output_dir, ec);
    }

    auto run(const json& definition, json vars = json::object()) -> Result<RunSummary> {
        auto workflow = parse_workflow(definition);
        REQUIRE(workflow.has_value());
        ctx = PipelineContext::create(std::move(vars));
        return run_sync(ioc_, runner_.run(*workflow, ctx));
    }

    auto runner() -> WorkflowRunner& { return runner_; }

    std::shared_ptr<FakeBrowserState> state;
    fs::path output_dir;
    PipelineContext ctx;

private:
    auto dispatcher() -> WorkflowRunner::BrowserDispatcher {
        auto d = host_.get_or_create();
        REQUIRE(d.has_value());
        return *d;
    }

    auto options() const -> RunnerOptions {
        RunnerOptions o;
        o.launch.headless = false;
        o.output_dir = output_dir;
        return o;
    }

    boost::asio::io_context ioc_;
    executor::Host<browser::Driver> host_;
    WorkflowRunner runner_;
};

auto steps(std::initializer_list<json> list) -> json {
    return json{{"name", "test"}, {"steps", json::array(list)}};
}

} // namespace

TEST_CASE("Browser steps reach the driver in order", "[workflow][runner]") {
    RunnerHarness h;
    auto summary = h.run(
        steps({
            {{"action", "open_browser"}, {"url", "{base}/login"}, {"headless", true}},
            {{"action", "identify"}, {"save_as", "user"}, {"selector", "#user"}},
            {{"action", "fill"}, {"element", "user"}, {"text", "alice"}},
            {{"action", "press_key"}, {"element", "user"}, {"key", "Enter"}},
            {{"action", "navigate"}, {"url", "{base}/home"}},
            {{"action", "close_browser"}},
        }),
        json{{"base", "https://example.com"}});

    REQUIRE(summary.has_value());
    CHECK(summary->workflow == "test");
    CHECK(summary->run_id == h.ctx.run_id);
    REQUIRE(summary->steps.size() == 6);
    CHECK(summary->steps[1].kind == "identify");

    CHECK(h.state->calls == std::vector<std::string>{
                                "open", "navigate https://example.com/login", "fill alice",
                                "press Enter", "navigate https://example.com/home", "close"});
    CHECK(h.state->last_launch.headless);
    CHECK(h.state->locators.at(0) == browser::Locator::css("#user"));
    CHECK(h.ctx.locators.contains("user"));
}

TEST_CASE("Workflow vars fill gaps without overriding the caller", "[workflow][runner]") {
    RunnerHarness h;
    auto summary = h.run(
        {{"vars", {{"base", "https://default"}, {"page", "docs"}}},
         {"steps", {{{"action", "navigate"}, {"url", "{base}/{page}"}}}}},
        json{{"base", "https://override"}});

    REQUIRE(summary.has_value());
    CHECK(h.state->calls == std::vector<std::string>{"navigate https://override/docs"});
    CHECK(h.ctx.vars["page"] == "docs");
}

TEST_CASE("The first failing step stops the run", "[workflow][runner]") {
    RunnerHarness h;
    h.state->failures.emplace(
        "navigate", make_error(ErrorCode::BrowserError, "Navigation failed", "net::ERR_NAME"));

    auto summary = h.run(steps({
        {{"action", "open_browser"}},
        {{"action", "navigate"}, {"url", "https://nowhere.invalid"}},
        {{"action", "close_browser"}},
    }));

    REQUIRE_FALSE(summary.has_value());
    CHECK(summary.error().code() == ErrorCode::BrowserError);
    CHECK(summary.error().message() == "Navigation failed");
    CHECK(summary.error().detail() == "step 1 (navigate): net::ERR_NAME");
    CHECK(h.state->calls.back() == "navigate https://nowhere.invalid");
}

TEST_CASE("Unknown saved elements fail before reaching the browser", "[workflow][runner]") {
    RunnerHarness h;
    auto summary = h.run(steps({{{"action", "hover"}, {"element", "ghost"}}}));

    REQUIRE_FALSE(summary.has_value());
    CHECK(summary.error().code() == ErrorCode::NotFound);
    CHECK(summary.error().detail() == "step 0 (hover): ghost");
    CHECK(h.state->calls.empty());
}

TEST_CASE("Interaction steps forward their options", "[workflow][runner]") {
    RunnerHarness h;
    auto summary = h.run(steps({
        {{"action", "click"}, {"position", {{"x", 5}, {"y", 6}}}, {"double_click", true}},
        {{"action", "hover"}, {"role", "button"}, {"name", "Menu"}},
        {{"action", "check"}, {"label", "Agree"}, {"to_be_checked", true}},
        {{"action", "select_options"}, {"selector", "select"}, {"options", {"red"}}},
        {{"action", "upload_files"}, {"selector", "input[type=file]"}, {"files", {"a", "b"}}},
        {{"action", "focus"}, {"selector", "#q"}},
        {{"action", "scroll"}, {"method", "mouse_wheel"}, {"x", 0}, {"y", 300}},
        {{"action", "drag_and_drop"}, {"source", {{"selector", "#a"}}},
         {"target", {{"selector", "#b"}}}},
        {{"action", "wait_for_element"}, {"selector", "#done"}, {"timeout", 1500}},
    }));

    REQUIRE(summary.has_value());
    CHECK(h.state->calls == std::vector<std::string>{
                                "click_at 5,6", "hover", "assert_checked", "select_options",
                                "upload 2", "focus", "scroll mouse_wheel 0,300",
                                "drag_and_drop", "wait_for_visible 1500"});
    CHECK(h.state->last_click.click_count == 2);
}

TEST_CASE("Screenshots are written under the output directory", "[workflow][runner]") {
    RunnerHarness h;
    h.state->image = "JPEGBYTES";

    auto summary = h.run(
        steps({{{"action", "screenshot"}, {"file_path", "shots/{name}.jpg"}, {"full_page", true}}}),
        json{{"name", "home"}});

    REQUIRE(summary.has_value());
    auto expected = h.output_dir / "shots" / "home.jpg";
    CHECK(h.ctx.vars["screenshot_path"] == expected.string());
    CHECK(read_text(expected) == "JPEGBYTES");
    CHECK(h.state->last_screenshot.format == "jpeg");
    CHECK(h.state->last_screenshot.full_page);
}

TEST_CASE("Captured endpoints are stored in vars", "[workflow][runner]") {
    RunnerHarness h;
    h.state->captured_url = "https://api.example.com/components/?page=1";

    auto found = h.run(steps({{{"action", "capture_endpoint"}, {"save_as", "api"}}}));
    REQUIRE(found.has_value());
    CHECK(h.ctx.vars["api"] == "https://api.example.com/components/?page=1");
    CHECK(h.state->calls.back() == "capture components/?");

    h.state->captured_url.reset();
    auto missing = h.run(steps({{{"action", "capture_endpoint"}}}));
    REQUIRE(missing.has_value());
    CHECK(h.ctx.vars["endpoint"] == "");
}

TEST_CASE("Transformed elements are saved when they exist", "[workflow][runner]") {
    RunnerHarness h;
    auto summary = h.run(steps({
        {{"action", "identify"}, {"save_as", "row"}, {"selector", "tr"}},
        {{"action", "transform_element"}, {"element", "row"},
         {"js_script", "n => n.parentElement"}, {"save_as", "table"}},
    }));

    REQUIRE(summary.has_value());
    REQUIRE(h.ctx.locators.contains("table"));
    CHECK(h.ctx.locators.at("table").transforms ==
          std::vector<std::string>{"n => n.parentElement"});
    CHECK(h.ctx.locators.at("row").transforms.empty());

    h.state->evaluate_result = false;
    auto missing = h.run(steps({{{"action", "transform_element"}, {"selector", "tr"},
                                 {"js_script", "n => null"}, {"save_as", "x"}}}));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == ErrorCode::NotFound);
    CHECK(missing.error().message() == "Transformed element not found");
}

TEST_CASE("Component info is extracted from the page JSON", "[workflow][runner]") {
    RunnerHarness h;
    h.state->page_text = R"({"results": [
        {"task": "PlaywrightClick", "category": "PLAYWRIGHT", "inputs": []},
        {"task": "HttpRequest", "category": "NETWORK"}
    ]})";

    auto summary = h.run(
        steps({{{"action", "extract_component_info"}, {"component_name", "{component}"}}}),
        json{{"component", "playwrightclick"}});

    REQUIRE(summary.has_value());
    CHECK(h.ctx.vars["comp_info_task"] == "PlaywrightClick");
    CHECK(h.ctx.vars["comp_info_category"] == "PLAYWRIGHT");
    CHECK(h.ctx.vars["comp_info"]["inputs"] == json::array());
    CHECK(h.ctx.vars["components"].size() == 2);
    CHECK(h.state->locators.back() == browser::Locator::css("body"));

    auto missing = h.run(steps({{{"action", "extract_component_info"},
                                 {"component_name", "Nope"}}}));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().message() == "Component not found!");

    h.state->page_text = "<html>";
    auto garbage = h.run(steps({{{"action", "extract_component_info"},
                                 {"component_name", "PlaywrightClick"}}}));
    REQUIRE_FALSE(garbage.has_value());
    CHECK(garbage.error().code() == ErrorCode::SerializationError);
}

TEST_CASE("Category info can be filtered from vars", "[workflow][runner]") {
    RunnerHarness h;
    json components = json::array({
        {{"task", "A"}, {"category", " Playwright "}},
        {{"task", "B"}, {"category", "NETWORK"}},
        {{"task", "C"}, {"category", "PLAYWRIGHT"}},
    });

    auto summary = h.run(
        steps({{{"action", "extract_category_info"}, {"from", "components"},
                {"category", "playwright"}}}),
        json{{"components", components}});

    REQUIRE(summary.has_value());
    CHECK(h.state->calls.empty());
    REQUIRE(h.ctx.vars["category_info"].size() == 2);
    CHECK(h.ctx.vars["category_info"][1]["task"] == "C");

    auto missing = h.run(steps({{{"action", "extract_category_info"}, {"from", "absent"},
                                 {"category", "x"}}}));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().message() == "Unknown variable");
}

TEST_CASE("README is drafted from loaded category data", "[workflow][runner]") {
    RunnerHarness h;
    auto provider = std::make_shared<FakeProvider>("```markdown\n# Playwright\n\nDocs\n```");
    h.runner().set_provider(provider);

    fs::create_directories(h.output_dir);
    auto data_file = h.output_dir / "category.json";
    std::ofstream(data_file) << json{
        {"category_info", {{{"task", "PlaywrightClick"}}}},
        {"readme_template", "# {Library}"},
        {"screenshot_links", {"https://img/1.png"}},
    }.dump();

    auto summary = h.run(
        steps({
            {{"action", "load_category_data"}, {"file_path", "{data}"}},
            {{"action", "generate_readme"}, {"output_path", "docs/README.md"}},
        }),
        json{{"data", data_file.string()}});

    REQUIRE(summary.has_value());
    auto readme = h.output_dir / "docs" / "README.md";
    CHECK(read_text(readme) == "# Playwright\n\nDocs\n");
    CHECK(h.ctx.vars["readme_path"] == readme.string());
    CHECK(h.ctx.vars["readme_template"] == "# {Library}");

    REQUIRE(provider->requests.size() == 1);
    const auto& prompt = provider->requests[0].messages.at(0).content;
    CHECK(prompt.find("PlaywrightClick") != std::string::npos);
    CHECK(prompt.find("https://img/1.png") != std::string::npos);
    CHECK(h.state->calls.empty());
}

TEST_CASE("README generation needs a provider", "[workflow][runner]") {
    RunnerHarness h;
    auto summary = h.run(steps({{{"action", "generate_readme"}}}));
    REQUIRE_FALSE(summary.has_value());
    CHECK(summary.error().code() == ErrorCode::InvalidConfig);
    CHECK(summary.error().message() == "OpenAI API key not found");
}

TEST_CASE("README templates are fetched through the text fetcher", "[workflow][runner]") {
    RunnerHarness h;
    std::vector<std::string> fetched;
    h.runner().set_text_fetcher(
        [&fetched](std::string url) -> boost::asio::awaitable<Result<std::string>> {
            fetched.push_back(url);
            co_return std::string("# Template");
        });

    auto summary = h.run(
        steps({{{"action", "fetch_readme_template"}, {"url", "{repo}/TEMPLATE.md"}}}),
        json{{"repo", "https://raw.example.com"}});

    REQUIRE(summary.has_value());
    CHECK(fetched == std::vector<std::string>{"https://raw.example.com/TEMPLATE.md"});
    CHECK(h.ctx.vars["readme_template"] == "# Template");
}

TEST_CASE("Waiting for time does not involve the browser", "[workflow][runner]") {
    RunnerHarness h;
    auto started = std::chrono::steady_clock::now();
    auto summary = h.run(steps({{{"action", "wait_for_time"}, {"time_in_seconds", 0.05}}}));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(summary.has_value());
    CHECK(elapsed >= std::chrono::milliseconds(50));
    CHECK(h.state->calls.empty());
}
