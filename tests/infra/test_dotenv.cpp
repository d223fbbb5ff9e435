#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "pagewright/infra/dotenv.hpp"

namespace fs = std::filesystem;
namespace dotenv = pagewright::infra::dotenv;

static auto write_env_file(const std::string& content) -> fs::path {
    auto tmp = fs::temp_directory_path() / "pagewright_test_dotenv.env";
    std::ofstream out(tmp);
    out << content;
    out.close();
    return tmp;
}

TEST_CASE("dotenv parse basic KEY=VALUE", "[infra][dotenv]") {
    auto env = dotenv::parse_string("FOO=bar\nBAZ=qux\n");

    REQUIRE(env.size() == 2);
    CHECK(env["FOO"] == "bar");
    CHECK(env["BAZ"] == "qux");
}

TEST_CASE("dotenv parse double-quoted values", "[infra][dotenv]") {
    auto env = dotenv::parse_string(R"(MSG="hello world")" "\n"
                                    R"(ESCAPED="line1\nline2")" "\n"
                                    R"(QUOTE="say \"hi\"")" "\n");

    CHECK(env["MSG"] == "hello world");
    CHECK(env["ESCAPED"] == "line1\nline2");
    CHECK(env["QUOTE"] == "say \"hi\"");
}

TEST_CASE("dotenv parse single-quoted values (literal)", "[infra][dotenv]") {
    auto env = dotenv::parse_string("LITERAL='hello\\nworld'\n");
    CHECK(env["LITERAL"] == "hello\\nworld");
}

TEST_CASE("dotenv parse skips comments, blanks and malformed lines", "[infra][dotenv]") {
    auto env = dotenv::parse_string(
        "# comment\n"
        "\n"
        "KEY1=value1\n"
        "no_equals_sign\n"
        "=no_key\n"
        "KEY2=value2 # trailing\n");

    REQUIRE(env.size() == 2);
    CHECK(env["KEY1"] == "value1");
    CHECK(env["KEY2"] == "value2");
}

TEST_CASE("dotenv parse export prefix and empty values", "[infra][dotenv]") {
    auto env = dotenv::parse_string("export OPENAI_API_KEY=sk-123\nEMPTY=\n");

    REQUIRE(env.size() == 2);
    CHECK(env["OPENAI_API_KEY"] == "sk-123");
    CHECK(env["EMPTY"] == "");
}

TEST_CASE("dotenv parse reads files and reports missing ones", "[infra][dotenv]") {
    auto path = write_env_file("A=1\n");
    auto env = dotenv::parse(path);
    REQUIRE(env.has_value());
    CHECK(env->at("A") == "1");
    fs::remove(path);

    auto missing = dotenv::parse("/nonexistent/path/.env");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == pagewright::ErrorCode::NotFound);
}

TEST_CASE("dotenv load keeps existing variables unless asked", "[infra][dotenv]") {
    ::setenv("PAGEWRIGHT_DOTENV_EXISTING", "original", 1);
    ::unsetenv("PAGEWRIGHT_DOTENV_NEW");
    auto path = write_env_file("PAGEWRIGHT_DOTENV_EXISTING=replaced\nPAGEWRIGHT_DOTENV_NEW=fresh\n");

    auto applied = dotenv::load(path);
    REQUIRE(applied.has_value());
    CHECK(*applied == 1);
    CHECK(std::string(std::getenv("PAGEWRIGHT_DOTENV_EXISTING")) == "original");
    CHECK(std::string(std::getenv("PAGEWRIGHT_DOTENV_NEW")) == "fresh");

    applied = dotenv::load(path, true);
    REQUIRE(applied.has_value());
    CHECK(*applied == 2);
    CHECK(std::string(std::getenv("PAGEWRIGHT_DOTENV_EXISTING")) == "replaced");

    ::unsetenv("PAGEWRIGHT_DOTENV_EXISTING");
    ::unsetenv("PAGEWRIGHT_DOTENV_NEW");
    fs::remove(path);
}
