#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "pagewright/cli/app.hpp"
#include "pagewright/core/error.hpp"

namespace pagewright::cli {

/// Register the `run` subcommand.
/// Executes a workflow file against a browser worker.
void register_run_command(CLI::App& app, std::shared_ptr<const GlobalOptions> options);

/// Register the `snap` subcommand.
/// Opens a page and saves a screenshot of it.
void register_snap_command(CLI::App& app, std::shared_ptr<const GlobalOptions> options);

/// Register the `config` subcommand.
/// Prints the effective configuration with secrets redacted.
void register_config_command(CLI::App& app, std::shared_ptr<const GlobalOptions> options);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

/// Replaces non-empty string values under sensitive keys (api_key, token,
/// secret) with a placeholder, at any depth.
auto redact_config_json(nlohmann::json& j) -> void;

/// Parses repeated `--var key=value` arguments. Values that parse as JSON
/// are kept typed; everything else is a string.
auto parse_vars(const std::vector<std::string>& assignments) -> Result<nlohmann::json>;

/// Places a relative output file under `output_dir`; absolute paths are
/// returned unchanged.
auto resolve_output_path(const std::string& path, const std::string& output_dir)
    -> std::filesystem::path;

} // namespace pagewright::cli
