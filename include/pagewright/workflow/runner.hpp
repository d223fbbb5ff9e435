#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "pagewright/browser/driver.hpp"
#include "pagewright/core/error.hpp"
#include "pagewright/executor/dispatcher.hpp"
#include "pagewright/llm/provider.hpp"
#include "pagewright/llm/readme.hpp"
#include "pagewright/workflow/context.hpp"
#include "pagewright/workflow/step.hpp"

namespace pagewright::workflow {

using boost::asio::awaitable;

struct RunnerOptions {
    browser::LaunchOptions launch;
    /// Base for relative screenshot and README paths.
    std::filesystem::path output_dir = ".";
    llm::ReadmeOptions readme;
};

struct StepReport {
    std::size_t index = 0;
    std::string kind;
    int64_t duration_ms = 0;
};

struct RunSummary {
    std::string workflow;
    std::string run_id;
    std::vector<StepReport> steps;
    int64_t duration_ms = 0;
};

/// Fetches a text document by URL.
using TextFetcher = std::function<awaitable<Result<std::string>>(std::string url)>;

/// Executes workflows step by step.
///
/// Steps that touch the browser are sent to the browser worker with
/// async_submit; everything else (timers, data handling, LLM calls) runs in
/// the calling coroutine.
class WorkflowRunner {
public:
    using BrowserDispatcher = executor::Dispatcher<browser::Driver>;

    /// `ioc` serves the default text fetcher and must outlive the runner.
    WorkflowRunner(boost::asio::io_context& ioc, BrowserDispatcher browser,
                   RunnerOptions options);

    void set_provider(std::shared_ptr<llm::Provider> provider);
    void set_text_fetcher(TextFetcher fetcher);

    /// Runs every step in order. The first failure stops the run; its detail
    /// names the step index and action.
    auto run(const Workflow& workflow, PipelineContext& ctx) -> awaitable<Result<RunSummary>>;

    auto run_step(const Step& step, PipelineContext& ctx) -> awaitable<Result<void>>;

    [[nodiscard]] auto options() const -> const RunnerOptions& { return options_; }

private:
    auto execute(const OpenBrowserStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const NavigateStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const IdentifyStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const ClickStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const FillStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const PressKeyStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const HoverStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const CheckStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const SelectOptionsStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const UploadFilesStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const FocusStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const ScrollStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const DragAndDropStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const ScreenshotStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const WaitForElementStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const WaitForTimeStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const CloseBrowserStep& step, PipelineContext& ctx) -> awaitable<Result<void>>;
    auto execute(const CaptureEndpointStep& step, PipelineContext& ctx)
        -> awaitable<Result<void>>;
    auto execute(const TransformElementStep& step, PipelineContext& ctx)
        -> awaitable<Result<void>>;
    auto execute(const ExtractComponentInfoStep& step, PipelineContext& ctx)
        -> awaitable<Result<void>>;
    auto execute(const ExtractCategoryInfoStep& step, PipelineContext& ctx)
        -> awaitable<Result<void>>;
    auto execute(const LoadCategoryDataStep& step, PipelineContext& ctx)
        -> awaitable<Result<void>>;
    auto execute(const FetchReadmeTemplateStep& step, PipelineContext& ctx)
        -> awaitable<Result<void>>;
    auto execute(const GenerateReadmeStep& step, PipelineContext& ctx)
        -> awaitable<Result<void>>;

    /// JSON read from the text of `source` (the page body when unset).
    auto read_json(const std::optional<ElementRef>& source, const PipelineContext& ctx)
        -> awaitable<Result<json>>;
    auto output_path(const std::string& path) const -> std::filesystem::path;

    BrowserDispatcher browser_;
    RunnerOptions options_;
    std::shared_ptr<llm::Provider> provider_;
    TextFetcher fetcher_;
};

} // namespace pagewright::workflow
