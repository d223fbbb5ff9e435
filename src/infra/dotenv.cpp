#include "pagewright/infra/dotenv.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pagewright::infra::dotenv {

namespace {

auto unquote(std::string_view body, char quote) -> std::string {
    std::string value;
    for (std::size_t pos = 0; pos < body.size(); ++pos) {
        char c = body[pos];
        if (c == quote) {
            break;
        }
        if (c == '\\' && quote == '"' && pos + 1 < body.size()) {
            char next = body[++pos];
            switch (next) {
                case 'n':  value += '\n'; break;
                case 'r':  value += '\r'; break;
                case 't':  value += '\t'; break;
                case '\\': value += '\\'; break;
                case '"':  value += '"';  break;
                default:
                    value += '\\';
                    value += next;
                    break;
            }
        } else {
            value += c;
        }
    }
    return value;
}

} // anonymous namespace

auto parse_string(std::string_view content) -> EnvMap {
    EnvMap env_map;
    std::istringstream in{std::string(content)};
    std::string raw_line;
    int line_number = 0;

    while (std::getline(in, raw_line)) {
        ++line_number;
        auto line = utils::trim(raw_line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.starts_with("export ")) {
            line = utils::trim(std::string_view(line).substr(7));
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            LOG_WARN(".env line {}: skipping malformed line (no '=')", line_number);
            continue;
        }

        auto key = utils::trim(std::string_view(line).substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN(".env line {}: skipping line with empty key", line_number);
            continue;
        }

        auto value = utils::trim(std::string_view(line).substr(eq_pos + 1));
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            value = unquote(std::string_view(value).substr(1), value.front());
        } else {
            if (auto comment = value.find(" #"); comment != std::string::npos) {
                value = utils::trim(std::string_view(value).substr(0, comment));
            }
        }

        env_map[std::move(key)] = std::move(value);
    }
    return env_map;
}

auto parse(const std::filesystem::path& path) -> Result<EnvMap> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::NotFound, "Could not open .env file",
                                          path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto env_map = parse_string(ss.str());
    LOG_DEBUG("Parsed {} variables from {}", env_map.size(), path.string());
    return env_map;
}

auto load(const std::filesystem::path& path, bool overwrite) -> Result<std::size_t> {
    auto env_map = parse(path);
    if (!env_map) {
        return std::unexpected(env_map.error());
    }

    std::size_t applied = 0;
    for (const auto& [key, value] : *env_map) {
        if (!overwrite && std::getenv(key.c_str()) != nullptr) {
            LOG_TRACE("Skipping existing env var: {}", key);
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
            LOG_WARN("Failed to set env var: {}", key);
            continue;
        }
        ++applied;
    }

    LOG_INFO("Loaded {} variable(s) from {}", applied, path.string());
    return applied;
}

} // namespace pagewright::infra::dotenv
