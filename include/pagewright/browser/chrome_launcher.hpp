#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include <nlohmann/json.hpp>

#include "pagewright/browser/driver.hpp"
#include "pagewright/core/error.hpp"

namespace pagewright::browser {

using json = nlohmann::json;

/// A Chrome process started with remote debugging enabled.
struct ChromeProcess {
    pid_t pid = -1;
    int debug_port = 0;
    std::filesystem::path user_data_dir;
    /// DevTools WebSocket URL of the initial page target.
    std::string page_ws_url;
};

/// Locates a Chrome/Chromium binary: the configured path, then well-known
/// install locations, then PATH. Empty when nothing is found.
auto find_chrome(const std::optional<std::string>& configured) -> std::string;

/// Command-line arguments (without argv[0]) for a debuggable Chrome.
auto build_chrome_args(const LaunchOptions& options,
                       const std::filesystem::path& user_data_dir)
    -> std::vector<std::string>;

/// Picks the WebSocket URL of the first "page" target from a /json/list
/// response.
auto select_page_target(const json& targets) -> std::optional<std::string>;

/// Starts Chrome and waits (up to launch_timeout_ms) for a page target.
auto launch_chrome(const LaunchOptions& options) -> Result<ChromeProcess>;

/// Stops the process (SIGTERM, then SIGKILL if it lingers), reaps it and
/// removes the temporary profile directory.
void terminate_chrome(ChromeProcess& process);

} // namespace pagewright::browser
