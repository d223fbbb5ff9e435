#include "pagewright/workflow/runner.hpp"
#include "pagewright/catalog/catalog.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"

#include <chrono>
#include <fstream>
#include <sstream>

namespace pagewright::workflow {

namespace {

using browser::Driver;
using browser::Locator;

auto annotate(const Error& err, std::size_t index, std::string_view kind) -> Error {
    auto detail = "step " + std::to_string(index) + " (" + std::string(kind) + ")";
    if (!err.detail().empty()) {
        detail += ": " + std::string(err.detail());
    }
    return make_error(err.code(), std::string(err.message()), std::move(detail));
}

auto resolve_optional(const std::optional<ElementRef>& ref, const PipelineContext& ctx)
    -> Result<std::optional<Locator>> {
    if (!ref) {
        return std::optional<Locator>{};
    }
    auto locator = ctx.resolve(*ref);
    if (!locator) {
        return std::unexpected(locator.error());
    }
    return std::optional<Locator>(std::move(*locator));
}

auto read_file(const std::filesystem::path& path) -> Result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::NotFound, "Cannot open file",
                                          path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

WorkflowRunner::WorkflowRunner(boost::asio::io_context& ioc, BrowserDispatcher browser,
                               RunnerOptions options)
    : browser_(std::move(browser)), options_(std::move(options)) {
    fetcher_ = [&ioc](std::string url) -> awaitable<Result<std::string>> {
        co_return co_await llm::fetch_text(ioc, url);
    };
}

void WorkflowRunner::set_provider(std::shared_ptr<llm::Provider> provider) {
    provider_ = std::move(provider);
}

void WorkflowRunner::set_text_fetcher(TextFetcher fetcher) {
    fetcher_ = std::move(fetcher);
}

auto WorkflowRunner::run(const Workflow& workflow, PipelineContext& ctx)
    -> awaitable<Result<RunSummary>> {
    RunSummary summary;
    summary.workflow = workflow.name;
    summary.run_id = ctx.run_id;

    // Workflow defaults never override variables supplied by the caller.
    for (const auto& [key, value] : workflow.vars.items()) {
        if (!ctx.vars.contains(key)) {
            ctx.vars[key] = value;
        }
    }

    LOG_INFO("[{}] Running workflow '{}' ({} steps)", ctx.run_id, workflow.name,
             workflow.steps.size());
    auto started = std::chrono::steady_clock::now();

    for (std::size_t i = 0; i < workflow.steps.size(); ++i) {
        const auto& step = workflow.steps[i];
        auto kind = step_kind(step);
        LOG_INFO("[{}] step {}: {}", ctx.run_id, i, kind);

        auto step_started = std::chrono::steady_clock::now();
        auto result = co_await run_step(step, ctx);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - step_started)
                           .count();

        if (!result) {
            auto err = annotate(result.error(), i, kind);
            LOG_ERROR("[{}] {}", ctx.run_id, err.what());
            co_return make_fail(std::move(err));
        }
        summary.steps.push_back({i, std::string(kind), elapsed});
    }

    summary.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    LOG_INFO("[{}] Workflow '{}' finished in {}ms", ctx.run_id, workflow.name,
             summary.duration_ms);
    co_return summary;
}

auto WorkflowRunner::run_step(const Step& step, PipelineContext& ctx) -> awaitable<Result<void>> {
    co_return co_await std::visit(
        [this, &ctx](const auto& s) { return execute(s, ctx); }, step);
}

auto WorkflowRunner::output_path(const std::string& path) const -> std::filesystem::path {
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p;
    }
    return options_.output_dir / p;
}

// -- Browser steps --

auto WorkflowRunner::execute(const OpenBrowserStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto launch = options_.launch;
    if (step.headless) {
        launch.headless = *step.headless;
    }

    std::optional<std::string> url;
    if (step.url) {
        auto formatted = ctx.format(*step.url);
        if (!formatted) co_return make_fail(formatted.error());
        url = std::move(*formatted);
    }

    co_return co_await browser_.async_submit([launch, url](Driver& driver) -> VoidResult {
        if (auto opened = driver.open(launch); !opened) {
            return opened;
        }
        if (url) {
            return driver.navigate(*url);
        }
        return {};
    });
}

auto WorkflowRunner::execute(const NavigateStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto url = ctx.format(step.url);
    if (!url) co_return make_fail(url.error());

    co_return co_await browser_.async_submit(
        [url = std::move(*url)](Driver& driver) { return driver.navigate(url); });
}

auto WorkflowRunner::execute(const IdentifyStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto locator = ctx.resolve(ElementRef{.element = std::nullopt, .locator = step.locator});
    if (!locator) co_return make_fail(locator.error());

    LOG_INFO("Identified element '{}' using {}", step.save_as, locator->describe());
    ctx.save_locator(step.save_as, std::move(*locator));
    co_return ok_result();
}

auto WorkflowRunner::execute(const ClickStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto target = resolve_optional(step.target, ctx);
    if (!target) co_return make_fail(target.error());

    browser::ClickOptions options;
    options.button = step.button;
    options.click_count = step.double_click ? 2 : 1;
    options.position = step.position;

    if (*target) {
        co_return co_await browser_.async_submit(
            [locator = **target, options](Driver& driver) {
                return driver.click(locator, options);
            });
    }
    co_return co_await browser_.async_submit([point = *step.position, options](Driver& driver) {
        return driver.click_at(point, options);
    });
}

auto WorkflowRunner::execute(const FillStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto locator = ctx.resolve(step.target);
    if (!locator) co_return make_fail(locator.error());

    browser::FillOptions options{.sequential = step.sequential, .delay_ms = step.delay_ms};
    co_return co_await browser_.async_submit(
        [locator = std::move(*locator), text = step.text, options](Driver& driver) {
            return driver.fill(locator, text, options);
        });
}

auto WorkflowRunner::execute(const PressKeyStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto target = resolve_optional(step.target, ctx);
    if (!target) co_return make_fail(target.error());

    co_return co_await browser_.async_submit(
        [key = step.key, locator = std::move(*target)](Driver& driver) {
            return driver.press(key, locator);
        });
}

auto WorkflowRunner::execute(const HoverStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto locator = ctx.resolve(step.target);
    if (!locator) co_return make_fail(locator.error());

    co_return co_await browser_.async_submit(
        [locator = std::move(*locator)](Driver& driver) { return driver.hover(locator); });
}

auto WorkflowRunner::execute(const CheckStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto locator = ctx.resolve(step.target);
    if (!locator) co_return make_fail(locator.error());

    co_return co_await browser_.async_submit(
        [locator = std::move(*locator), assert_only = step.assert_only](Driver& driver) {
            return driver.check(locator, assert_only);
        });
}

auto WorkflowRunner::execute(const SelectOptionsStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto locator = ctx.resolve(step.target);
    if (!locator) co_return make_fail(locator.error());

    auto selected = co_await browser_.async_submit(
        [locator = std::move(*locator), options = step.options](Driver& driver) {
            return driver.select_options(locator, options);
        });
    if (!selected) co_return make_fail(selected.error());

    LOG_INFO("Selected options: {}", json(*selected).dump());
    co_return ok_result();
}

auto WorkflowRunner::execute(const UploadFilesStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto locator = ctx.resolve(step.target);
    if (!locator) co_return make_fail(locator.error());

    co_return co_await browser_.async_submit(
        [locator = std::move(*locator), files = step.files](Driver& driver) {
            return driver.set_input_files(locator, files);
        });
}

auto WorkflowRunner::execute(const FocusStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto locator = ctx.resolve(step.target);
    if (!locator) co_return make_fail(locator.error());

    co_return co_await browser_.async_submit(
        [locator = std::move(*locator)](Driver& driver) { return driver.focus(locator); });
}

auto WorkflowRunner::execute(const ScrollStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto target = resolve_optional(step.target, ctx);
    if (!target) co_return make_fail(target.error());

    co_return co_await browser_.async_submit(
        [locator = std::move(*target), method = step.method, dx = step.dx,
         dy = step.dy](Driver& driver) { return driver.scroll(locator, method, dx, dy); });
}

auto WorkflowRunner::execute(const DragAndDropStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto source = ctx.resolve(step.source);
    if (!source) co_return make_fail(source.error());
    auto target = ctx.resolve(step.target);
    if (!target) co_return make_fail(target.error());

    co_return co_await browser_.async_submit(
        [source = std::move(*source), target = std::move(*target)](Driver& driver) {
            return driver.drag_and_drop(source, target);
        });
}

auto WorkflowRunner::execute(const ScreenshotStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto target = resolve_optional(step.target, ctx);
    if (!target) co_return make_fail(target.error());
    auto file = ctx.format(step.file_path);
    if (!file) co_return make_fail(file.error());

    browser::ScreenshotOptions options;
    options.full_page = step.full_page;
    options.element = std::move(*target);
    if (file->ends_with(".jpg") || file->ends_with(".jpeg")) {
        options.format = "jpeg";
    }

    auto image = co_await browser_.async_submit(
        [options](Driver& driver) { return driver.screenshot(options); });
    if (!image) co_return make_fail(image.error());

    auto path = output_path(*file);
    if (auto written = utils::write_file(path, *image); !written) {
        co_return make_fail(written.error());
    }
    ctx.vars["screenshot_path"] = path.string();
    LOG_INFO("Screenshot saved to {}", path.string());
    co_return ok_result();
}

auto WorkflowRunner::execute(const WaitForElementStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto locator = ctx.resolve(step.target);
    if (!locator) co_return make_fail(locator.error());

    co_return co_await browser_.async_submit(
        [locator = std::move(*locator), timeout = step.timeout_ms](Driver& driver) {
            return driver.wait_for_visible(locator, timeout);
        });
}

auto WorkflowRunner::execute(const WaitForTimeStep& step, PipelineContext&)
    -> awaitable<Result<void>> {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(std::chrono::milliseconds(static_cast<int64_t>(step.seconds * 1000)));
    co_await timer.async_wait(boost::asio::use_awaitable);
    LOG_DEBUG("Waited {}s", step.seconds);
    co_return ok_result();
}

auto WorkflowRunner::execute(const CloseBrowserStep&, PipelineContext&)
    -> awaitable<Result<void>> {
    co_return co_await browser_.async_submit([](Driver& driver) { return driver.close(); });
}

auto WorkflowRunner::execute(const CaptureEndpointStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    browser::CaptureOptions options{.reload = step.reload, .wait_ms = step.wait_ms};
    auto captured = co_await browser_.async_submit(
        [fragment = step.fragment, options](Driver& driver) {
            return driver.capture_requests(fragment, options);
        });
    if (!captured) co_return make_fail(captured.error());

    if (*captured) {
        LOG_INFO("Endpoint found and stored: {}", **captured);
    } else {
        LOG_WARN("No endpoint found that contains '{}'", step.fragment);
    }
    ctx.vars[step.save_as] = captured->value_or("");
    co_return ok_result();
}

auto WorkflowRunner::execute(const TransformElementStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto locator = ctx.resolve(step.target);
    if (!locator) co_return make_fail(locator.error());

    auto derived = locator->with_transform(step.script);
    auto probe = "(" + browser::element_expression(derived) + ") != null";
    auto found = co_await browser_.async_submit(
        [probe](Driver& driver) { return driver.evaluate(probe); });
    if (!found) co_return make_fail(found.error());
    if (!found->is_boolean() || !found->get<bool>()) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Transformed element not found",
                                       derived.describe()));
    }

    ctx.save_locator(step.save_as, std::move(derived));
    co_return ok_result();
}

// -- Data steps --

auto WorkflowRunner::read_json(const std::optional<ElementRef>& source,
                               const PipelineContext& ctx) -> awaitable<Result<json>> {
    auto target = resolve_optional(source, ctx);
    if (!target) co_return make_fail(target.error());
    auto locator = target->value_or(Locator::css("body"));

    auto text = co_await browser_.async_submit(
        [locator](Driver& driver) { return driver.inner_text(locator); });
    if (!text) co_return make_fail(text.error());

    auto data = json::parse(*text, nullptr, false);
    if (data.is_discarded()) {
        co_return make_fail(make_error(ErrorCode::SerializationError,
                                       "Page content is not valid JSON", locator.describe()));
    }
    co_return data;
}

auto WorkflowRunner::execute(const ExtractComponentInfoStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto name = ctx.format(step.task);
    if (!name) co_return make_fail(name.error());

    auto data = co_await read_json(step.source, ctx);
    if (!data) co_return make_fail(data.error());

    auto components = catalog::flatten_components(*data);
    ctx.vars["components"] = components;

    auto component = catalog::find_component(components, *name);
    if (!component) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Component not found!", *name));
    }

    ctx.vars["comp_info_category"] = component->value("category", "");
    ctx.vars["comp_info_task"] = component->value("task", "");
    ctx.vars["comp_info"] = std::move(*component);
    LOG_INFO("Extracted component info: {}", ctx.vars["comp_info"].dump());
    co_return ok_result();
}

auto WorkflowRunner::execute(const ExtractCategoryInfoStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto category = ctx.format(step.category);
    if (!category) co_return make_fail(category.error());

    json data;
    if (step.from) {
        const auto* value = lookup_var(ctx.vars, *step.from);
        if (value == nullptr) {
            co_return make_fail(make_error(ErrorCode::NotFound, "Unknown variable", *step.from));
        }
        data = *value;
    } else {
        auto body = co_await read_json(std::nullopt, ctx);
        if (!body) co_return make_fail(body.error());
        data = std::move(*body);
    }

    auto filtered = catalog::filter_category(catalog::flatten_components(data), *category);
    LOG_INFO("Extracted category info for '{}': {} components", utils::trim(*category),
             filtered.size());
    ctx.vars[step.save_as] = std::move(filtered);
    co_return ok_result();
}

auto WorkflowRunner::execute(const LoadCategoryDataStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto file = ctx.format(step.file_path);
    if (!file) co_return make_fail(file.error());

    auto text = read_file(*file);
    if (!text) co_return make_fail(text.error());
    auto data = catalog::parse_category_data(std::string_view(*text));
    if (!data) co_return make_fail(data.error());

    ctx.vars["category_info"] = data->category_info;
    ctx.vars["readme_template"] = data->readme_template;
    ctx.vars["screenshot_links"] = data->screenshot_links;
    LOG_INFO("Loaded category data from {} ({} components)", *file,
             data->category_info.size());
    co_return ok_result();
}

auto WorkflowRunner::execute(const FetchReadmeTemplateStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    auto url = ctx.format(step.url);
    if (!url) co_return make_fail(url.error());

    auto text = co_await fetcher_(*url);
    if (!text) co_return make_fail(text.error());

    ctx.vars[step.save_as] = std::move(*text);
    co_return ok_result();
}

auto WorkflowRunner::execute(const GenerateReadmeStep& step, PipelineContext& ctx)
    -> awaitable<Result<void>> {
    if (!provider_) {
        co_return make_fail(make_error(ErrorCode::InvalidConfig, "OpenAI API key not found",
                                       "set OPENAI_API_KEY or llm.api_key"));
    }

    json bundle = json::object();
    for (const auto* key : {"category_info", "readme_template", "screenshot_links"}) {
        if (const auto* value = lookup_var(ctx.vars, key)) {
            bundle[key] = *value;
        }
    }
    auto data = catalog::parse_category_data(bundle);
    if (!data) co_return make_fail(data.error());

    llm::ReadmeGenerator generator(provider_, options_.readme);
    auto readme = co_await generator.generate(*data);
    if (!readme) co_return make_fail(readme.error());

    auto file = ctx.format(step.output_path);
    if (!file) co_return make_fail(file.error());
    auto path = output_path(*file);
    if (auto written = utils::write_file(path, *readme); !written) {
        co_return make_fail(written.error());
    }

    ctx.vars["readme_path"] = path.string();
    LOG_INFO("README.md has been generated at {}", path.string());
    co_return ok_result();
}

} // namespace pagewright::workflow
