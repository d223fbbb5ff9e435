#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "pagewright/core/error.hpp"

namespace pagewright::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto generate_uuid() -> std::string;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto base64_encode(std::string_view data) -> std::string;
auto base64_decode(std::string_view data) -> std::string;

/// Quotes a string as a JavaScript string literal (double quotes, escaped).
auto js_string_literal(std::string_view s) -> std::string;

/// Splits an absolute http(s) URL into origin ("https://host:port") and
/// path-with-query ("/a/b?c"). The path defaults to "/".
struct UrlParts {
    std::string origin;
    std::string path;
};
auto split_url(std::string_view url) -> UrlParts;

/// Writes `content` to `path`, replacing the file and creating parent
/// directories.
auto write_file(const std::filesystem::path& path, std::string_view content) -> VoidResult;

} // namespace pagewright::utils
