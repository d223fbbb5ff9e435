#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include "pagewright/core/utils.hpp"

namespace utils = pagewright::utils;

TEST_CASE("generate_id produces ids of requested length", "[utils]") {
    CHECK(utils::generate_id().size() == 16);
    CHECK(utils::generate_id(8).size() == 8);

    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(utils::generate_id());
    }
    CHECK(seen.size() == 100);
}

TEST_CASE("generate_uuid produces canonical uuids", "[utils]") {
    auto id = utils::generate_uuid();
    REQUIRE(id.size() == 36);
    CHECK(id[8] == '-');
    CHECK(id[13] == '-');
    CHECK(id[14] == '4');
    CHECK(utils::generate_uuid() != id);
}

TEST_CASE("trim strips surrounding whitespace", "[utils]") {
    CHECK(utils::trim("  PLAYWRIGHT \n") == "PLAYWRIGHT");
    CHECK(utils::trim("\t\r\n ") == "");
    CHECK(utils::trim("a b") == "a b");
}

TEST_CASE("split keeps empty middle fields", "[utils]") {
    auto parts = utils::split("a..b", '.');
    REQUIRE(parts.size() == 3);
    CHECK(parts[0] == "a");
    CHECK(parts[1] == "");
    CHECK(parts[2] == "b");

    CHECK(utils::split("", '.').empty());
    CHECK(utils::split("single", '.') == std::vector<std::string>{"single"});
}

TEST_CASE("to_lower", "[utils]") {
    CHECK(utils::to_lower("Playwright Click") == "playwright click");
    CHECK(utils::to_lower("") == "");
}

TEST_CASE("base64 encodes and decodes", "[utils]") {
    CHECK(utils::base64_encode("") == "");
    CHECK(utils::base64_encode("f") == "Zg==");
    CHECK(utils::base64_encode("fo") == "Zm8=");
    CHECK(utils::base64_encode("foo") == "Zm9v");

    CHECK(utils::base64_decode("Zm9vYmFy") == "foobar");
    CHECK(utils::base64_decode("Zm8=") == "fo");

    std::string png_header("\x89PNG\r\n\x1a\n", 8);
    CHECK(utils::base64_decode(utils::base64_encode(png_header)) == png_header);
}

TEST_CASE("js_string_literal quotes and escapes", "[utils]") {
    CHECK(utils::js_string_literal("button") == "\"button\"");
    CHECK(utils::js_string_literal("a\"b") == "\"a\\\"b\"");
    CHECK(utils::js_string_literal("line\nbreak") == "\"line\\nbreak\"");
}

TEST_CASE("split_url separates origin and path", "[utils]") {
    auto parts = utils::split_url("https://raw.githubusercontent.com/org/repo/main/README.md");
    CHECK(parts.origin == "https://raw.githubusercontent.com");
    CHECK(parts.path == "/org/repo/main/README.md");

    parts = utils::split_url("http://localhost:8080");
    CHECK(parts.origin == "http://localhost:8080");
    CHECK(parts.path == "/");

    parts = utils::split_url("http://127.0.0.1:9222/json/list?x=1");
    CHECK(parts.origin == "http://127.0.0.1:9222");
    CHECK(parts.path == "/json/list?x=1");
}

TEST_CASE("write_file creates parent directories", "[utils]") {
    namespace fs = std::filesystem;
    auto dir = fs::temp_directory_path() / ("pagewright_utils_" + utils::generate_id(8));
    auto path = dir / "nested" / "out.bin";

    std::string content("\x00\x01binary", 8);
    REQUIRE(utils::write_file(path, content).has_value());

    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    CHECK(buffer.str() == content);

    fs::remove_all(dir);
}

TEST_CASE("write_file reports unwritable paths", "[utils]") {
    auto result = utils::write_file("/proc/pagewright/does/not/exist.txt", "x");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == pagewright::ErrorCode::IoError);
}
