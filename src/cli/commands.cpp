#include "pagewright/cli/commands.hpp"
#include "pagewright/browser/cdp_driver.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"
#include "pagewright/executor/host.hpp"
#include "pagewright/llm/openai.hpp"
#include "pagewright/workflow/runner.hpp"

#include <chrono>
#include <iostream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <nlohmann/json.hpp>

namespace pagewright::cli {

using json = nlohmann::json;

namespace {

using BrowserHost = executor::Host<browser::Driver>;

/// Reports a failure and makes CLI11 exit with status 1.
[[noreturn]] void fail(const Error& err) {
    LOG_ERROR("{} [{}]", err.what(), error_code_to_string(err.code()));
    Logger::flush();
    std::cerr << "error: " << err.what() << "\n";
    throw CLI::RuntimeError(1);
}

auto make_browser_host() -> std::unique_ptr<BrowserHost> {
    return std::make_unique<BrowserHost>(
        []() -> Result<std::unique_ptr<browser::Driver>> {
            return std::make_unique<browser::CdpDriver>();
        },
        "browser");
}

/// Best-effort browser shutdown after a run; the worker destroys the driver
/// regardless.
void close_browser(executor::Dispatcher<browser::Driver>& browser) {
    auto closed = browser.submit([](browser::Driver& driver) { return driver.close(); });
    if (!closed) {
        LOG_WARN("Closing browser failed: {}", closed.error().what());
    }
}

struct RunOptions {
    std::string workflow_path;
    std::vector<std::string> vars;
    std::string output_dir;
    bool headless = false;
};

struct SnapOptions {
    std::string url;
    std::string output = "screenshot.png";
    bool full_page = false;
    int timeout_ms = 0;
};

} // anonymous namespace

auto redact_config_json(json& j) -> void {
    static const std::vector<std::string> sensitive_keys = {
        "api_key", "token", "secret",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = false;
            for (const auto& key : sensitive_keys) {
                if (it.key() == key) {
                    is_sensitive = true;
                    break;
                }
            }
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else {
                redact_config_json(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_config_json(elem);
        }
    }
}

auto parse_vars(const std::vector<std::string>& assignments) -> Result<json> {
    json vars = json::object();
    for (const auto& assignment : assignments) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Expected key=value", assignment));
        }
        auto key = utils::trim(std::string_view(assignment).substr(0, eq));
        auto raw = assignment.substr(eq + 1);
        auto parsed = json::parse(raw, nullptr, false);
        vars[key] = (parsed.is_discarded() || parsed.is_string()) ? json(raw) : parsed;
    }
    return vars;
}

auto resolve_output_path(const std::string& path, const std::string& output_dir)
    -> std::filesystem::path {
    std::filesystem::path p(path);
    if (p.is_absolute() || output_dir.empty()) {
        return p;
    }
    return std::filesystem::path(output_dir) / p;
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, std::shared_ptr<const GlobalOptions> options) {
    auto* sub = app.add_subcommand("run", "Run a workflow file");
    auto opts = std::make_shared<RunOptions>();

    sub->add_option("workflow", opts->workflow_path, "Workflow definition (JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_option("--var", opts->vars, "Workflow variable as key=value (repeatable)");
    sub->add_option("-o,--output-dir", opts->output_dir,
                    "Directory for screenshots and README files");
    sub->add_flag("--headless", opts->headless, "Run the browser without a window");

    sub->callback([options, opts]() {
        auto config = prepare_config(*options);
        if (!config) fail(config.error());

        auto workflow = workflow::load_workflow(opts->workflow_path);
        if (!workflow) fail(workflow.error());

        auto vars = parse_vars(opts->vars);
        if (!vars) fail(vars.error());

        auto host = make_browser_host();
        auto browser = host->get_or_create();
        if (!browser) fail(browser.error());

        boost::asio::io_context ioc;

        workflow::RunnerOptions runner_options;
        runner_options.launch = browser::LaunchOptions::from_config(config->browser);
        if (opts->headless) {
            runner_options.launch.headless = true;
        }
        runner_options.output_dir = opts->output_dir.empty() ? config->output_dir
                                                             : opts->output_dir;
        runner_options.readme.model = config->llm.model;
        runner_options.readme.max_tokens = config->llm.max_tokens;
        runner_options.readme.temperature = config->llm.temperature;

        workflow::WorkflowRunner runner(ioc, *browser, runner_options);
        if (auto provider = llm::OpenAIProvider::create(ioc, config->llm)) {
            runner.set_provider(std::move(*provider));
        } else {
            LOG_DEBUG("README generation unavailable: {}", provider.error().what());
        }

        auto ctx = workflow::PipelineContext::create(std::move(*vars));
        auto future = boost::asio::co_spawn(ioc, runner.run(*workflow, ctx),
                                            boost::asio::use_future);
        ioc.run();

        Result<workflow::RunSummary> summary = std::unexpected(
            make_error(ErrorCode::InternalError, "Workflow did not complete"));
        try {
            summary = future.get();
        } catch (const std::exception& e) {
            summary = std::unexpected(make_error(ErrorCode::InternalError,
                                                 "Workflow run threw", e.what()));
        }

        close_browser(*browser);
        if (!summary) fail(summary.error());

        std::cout << "Workflow '" << summary->workflow << "' completed: "
                  << summary->steps.size() << " steps in " << summary->duration_ms
                  << "ms (run " << summary->run_id << ")\n";
    });
}

// ---------------------------------------------------------------------------
// snap command
// ---------------------------------------------------------------------------

void register_snap_command(CLI::App& app, std::shared_ptr<const GlobalOptions> options) {
    auto* sub = app.add_subcommand("snap", "Open a page and save a screenshot");
    auto opts = std::make_shared<SnapOptions>();

    sub->add_option("url", opts->url, "Page to open")->required();
    sub->add_option("-o,--output", opts->output, "Screenshot file")
        ->default_val("screenshot.png");
    sub->add_flag("--full-page", opts->full_page, "Capture the whole scrollable page");
    sub->add_option("--timeout", opts->timeout_ms,
                    "Give up waiting for each browser step after this many ms (0 = no limit)");

    sub->callback([options, opts]() {
        auto config = prepare_config(*options);
        if (!config) fail(config.error());

        auto host = make_browser_host();
        auto browser = host->get_or_create();
        if (!browser) fail(browser.error());

        auto launch = browser::LaunchOptions::from_config(config->browser);
        browser::ScreenshotOptions shot;
        shot.full_page = opts->full_page;

        // Each step is a blocking round trip to the browser worker.
        auto submit = [&](auto op) {
            if (opts->timeout_ms > 0) {
                return browser->submit_for(std::move(op),
                                           std::chrono::milliseconds(opts->timeout_ms));
            }
            return browser->submit(std::move(op));
        };

        auto opened = submit([launch](browser::Driver& d) { return d.open(launch); });
        if (!opened) fail(opened.error());

        auto navigated = submit([url = opts->url](browser::Driver& d) { return d.navigate(url); });
        if (!navigated) {
            close_browser(*browser);
            fail(navigated.error());
        }

        auto image = submit([shot](browser::Driver& d) { return d.screenshot(shot); });
        close_browser(*browser);
        if (!image) fail(image.error());

        auto path = resolve_output_path(opts->output, config->output_dir);
        if (auto written = utils::write_file(path, *image); !written) {
            fail(written.error());
        }
        std::cout << "Saved " << image->size() << " bytes to " << path.string() << "\n";
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, std::shared_ptr<const GlobalOptions> options) {
    auto* sub = app.add_subcommand("config", "Show the effective configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only, "Validate configuration without printing");

    sub->callback([options, validate_only]() {
        auto config = prepare_config(*options);
        if (!config) fail(config.error());

        if (*validate_only) {
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = *config;
        redact_config_json(j);
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "pagewright " << PAGEWRIGHT_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif

#if defined(__APPLE__)
        std::cout << "Platform: macOS\n";
#elif defined(__linux__)
        std::cout << "Platform: Linux\n";
#else
        std::cout << "Platform: other\n";
#endif
    });
}

} // namespace pagewright::cli
