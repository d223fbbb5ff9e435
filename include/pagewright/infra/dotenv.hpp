#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pagewright/core/error.hpp"

namespace pagewright::infra::dotenv {

using EnvMap = std::unordered_map<std::string, std::string>;

/// Parses .env text. Supports KEY=VALUE, double-quoted values with escapes,
/// single-quoted literal values, `export` prefixes, full-line comments and
/// ` #` comments after unquoted values. Malformed lines are skipped.
auto parse_string(std::string_view content) -> EnvMap;

/// Reads and parses a .env file; NotFound if it cannot be opened.
auto parse(const std::filesystem::path& path) -> Result<EnvMap>;

/// Exports the file's variables into the process environment. Existing
/// variables are kept unless `overwrite` is set. Returns how many were set.
auto load(const std::filesystem::path& path, bool overwrite = false) -> Result<std::size_t>;

} // namespace pagewright::infra::dotenv
