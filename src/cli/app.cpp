#include "pagewright/cli/app.hpp"
#include "pagewright/cli/commands.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/infra/dotenv.hpp"

#include <filesystem>

namespace pagewright::cli {

auto prepare_config(const GlobalOptions& options) -> Result<Config> {
    Config config = default_config();
    if (!options.config_path.empty()) {
        config = load_config(std::filesystem::path(options.config_path));
    }

    auto env_file = config.env_file.value_or(options.env_file);
    if (!env_file.empty() && std::filesystem::exists(env_file)) {
        auto loaded = infra::dotenv::load(env_file);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        // Key values may come from the .env file just loaded.
        config.llm.api_key = resolve_env_refs(config.llm.api_key);
    }

    apply_env_overrides(config);
    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }

    if (auto level = Logger::parse_level(config.log_level); !level) {
        return std::unexpected(level.error());
    }
    Logger::init("pagewright", config.log_level);
    if (!options.config_path.empty()) {
        LOG_INFO("Loaded configuration from: {}", options.config_path);
    }
    return config;
}

App::App()
    : cli_("pagewright", "Serialized browser automation and README drafting"),
      options_(std::make_shared<GlobalOptions>()) {
    cli_.set_version_flag("--version", PAGEWRIGHT_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", options_->config_path,
                    "Path to configuration file (JSON)")
        ->envname("PAGEWRIGHT_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", options_->log_level,
                    "Log level (trace, debug, info, warn, error, critical)");

    cli_.add_option("--env-file", options_->env_file, "Environment file loaded at start-up")
        ->default_val(".env");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

void App::setup_commands() {
    register_run_command(cli_, options_);
    register_snap_command(cli_, options_);
    register_config_command(cli_, options_);
    register_version_command(cli_);
}

} // namespace pagewright::cli
