#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "pagewright/core/config.hpp"
#include "pagewright/core/error.hpp"

namespace pagewright::cli {

/// Options shared by every subcommand.
struct GlobalOptions {
    std::string config_path;
    std::string log_level;
    std::string env_file = ".env";
};

/// Builds the effective configuration: config file (or defaults), .env
/// file, environment overrides, then command-line overrides. Initializes
/// the logger with the resulting level.
auto prepare_config(const GlobalOptions& options) -> Result<Config>;

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (run, snap, config, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;

private:
    void setup_commands();

    CLI::App cli_;
    std::shared_ptr<GlobalOptions> options_;
};

} // namespace pagewright::cli
