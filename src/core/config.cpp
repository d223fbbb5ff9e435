#include "pagewright/core/config.hpp"
#include "pagewright/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace pagewright {

namespace {

auto parse_bool(std::string_view value) -> bool {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();
        config.llm.api_key = resolve_env_refs(config.llm.api_key);
        if (config.browser.chrome_path) {
            config.browser.chrome_path = resolve_env_refs(*config.browser.chrome_path);
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto default_config() -> Config {
    return Config{};
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("PAGEWRIGHT_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("PAGEWRIGHT_CHROME_PATH")) {
        config.browser.chrome_path = val;
    }
    if (auto* val = std::getenv("PAGEWRIGHT_HEADLESS")) {
        config.browser.headless = parse_bool(val);
    }
    if (auto* val = std::getenv("PAGEWRIGHT_DEBUG_PORT")) {
        try {
            config.browser.debug_port = std::stoi(val);
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid PAGEWRIGHT_DEBUG_PORT: {}", val);
        }
    }
    if (auto* val = std::getenv("PAGEWRIGHT_OUTPUT_DIR")) {
        config.output_dir = val;
    }
    if (auto* val = std::getenv("OPENAI_API_KEY"); val && config.llm.api_key.empty()) {
        config.llm.api_key = val;
    }
    if (auto* val = std::getenv("OPENAI_BASE_URL")) {
        config.llm.base_url = val;
    }
    if (auto* val = std::getenv("OPENAI_MODEL")) {
        config.llm.model = val;
    }
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Unresolved refs are kept verbatim
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace pagewright
