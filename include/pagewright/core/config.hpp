#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// std::optional serializer for nlohmann/json, so the NLOHMANN_DEFINE macros
// accept optional fields.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace pagewright {

using json = nlohmann::json;

struct BrowserConfig {
    std::optional<std::string> chrome_path;
    bool headless = false;
    int debug_port = 9222;
    int launch_timeout_ms = 10000;
    int navigation_timeout_ms = 30000;
    int viewport_width = 1280;
    int viewport_height = 800;
    std::vector<std::string> extra_args;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BrowserConfig, chrome_path, headless, debug_port,
    launch_timeout_ms, navigation_timeout_ms, viewport_width, viewport_height, extra_args)

struct LlmConfig {
    std::string provider = "openai";
    std::string api_key;
    std::optional<std::string> base_url;
    std::string model = "gpt-4o";
    int max_tokens = 1500;
    double temperature = 0.5;
    int timeout_seconds = 120;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LlmConfig, provider, api_key, base_url, model,
    max_tokens, temperature, timeout_seconds)

struct Config {
    BrowserConfig browser;
    LlmConfig llm;
    std::string log_level = "info";
    std::string output_dir = ".";
    std::optional<std::string> env_file;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, browser, llm, log_level, output_dir, env_file)

auto load_config(const std::filesystem::path& path) -> Config;
auto default_config() -> Config;

/// Applies PAGEWRIGHT_* and OPENAI_* environment overrides on top of `config`.
void apply_env_overrides(Config& config);

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace pagewright
