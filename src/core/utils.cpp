#include "pagewright/core/utils.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <random>

#include <nlohmann/json.hpp>
#include <uuid.h>

namespace pagewright::utils {

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += chars[dist(rng)];
    }
    return result;
}

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 rng(std::random_device{}());
    auto gen = uuids::uuid_random_generator(rng);
    return uuids::to_string(gen());
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto base64_encode(std::string_view data) -> std::string {
    static constexpr std::string_view table =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        auto a = static_cast<uint8_t>(data[i++]);
        auto b = static_cast<uint8_t>(data[i++]);
        auto c = static_cast<uint8_t>(data[i++]);
        result += table[(a >> 2) & 0x3F];
        result += table[((a & 0x03) << 4) | ((b >> 4) & 0x0F)];
        result += table[((b & 0x0F) << 2) | ((c >> 6) & 0x03)];
        result += table[c & 0x3F];
    }
    if (i < data.size()) {
        auto a = static_cast<uint8_t>(data[i++]);
        result += table[(a >> 2) & 0x3F];
        if (i < data.size()) {
            auto b = static_cast<uint8_t>(data[i]);
            result += table[((a & 0x03) << 4) | ((b >> 4) & 0x0F)];
            result += table[((b & 0x0F) << 2)];
        } else {
            result += table[(a & 0x03) << 4];
            result += '=';
        }
        result += '=';
    }
    return result;
}

namespace {
constexpr auto make_b64_decode_table() -> std::array<uint8_t, 256> {
    std::array<uint8_t, 256> t{};
    for (int i = 0; i < 26; ++i) t['A' + i] = static_cast<uint8_t>(i);
    for (int i = 0; i < 26; ++i) t['a' + i] = static_cast<uint8_t>(26 + i);
    for (int i = 0; i < 10; ++i) t['0' + i] = static_cast<uint8_t>(52 + i);
    t['+'] = 62;
    t['/'] = 63;
    return t;
}
} // namespace

auto base64_decode(std::string_view data) -> std::string {
    static constexpr auto table = make_b64_decode_table();

    std::string result;
    result.reserve((data.size() / 4) * 3);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : data) {
        if (c == '=' || c == '\n' || c == '\r') continue;
        buf = (buf << 6) | table[static_cast<uint8_t>(c)];
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result += static_cast<char>((buf >> bits) & 0xFF);
        }
    }
    return result;
}

auto js_string_literal(std::string_view s) -> std::string {
    return nlohmann::json(std::string(s)).dump();
}

auto split_url(std::string_view url) -> UrlParts {
    auto scheme_end = url.find("://");
    auto host_start = scheme_end == std::string_view::npos ? 0 : scheme_end + 3;
    auto path_start = url.find('/', host_start);

    if (path_start == std::string_view::npos) {
        return {std::string(url), "/"};
    }
    return {std::string(url.substr(0, path_start)), std::string(url.substr(path_start))};
}

auto write_file(const std::filesystem::path& path, std::string_view content) -> VoidResult {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError, "Failed to create directory",
                                              path.parent_path().string() + ": " + ec.message()));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(make_error(ErrorCode::IoError, "Failed to open file for writing",
                                          path.string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        return std::unexpected(make_error(ErrorCode::IoError, "Failed to write file",
                                          path.string()));
    }
    return {};
}

} // namespace pagewright::utils
