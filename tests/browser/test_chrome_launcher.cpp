#include <catch2/catch_test_macros.hpp>

#include <algorithm>

#include "pagewright/browser/chrome_launcher.hpp"
#include "pagewright/browser/page_actions.hpp"

using namespace pagewright;
using namespace pagewright::browser;

namespace {

auto has_arg(const std::vector<std::string>& args, const std::string& arg) -> bool {
    return std::find(args.begin(), args.end(), arg) != args.end();
}

} // namespace

TEST_CASE("Chrome args enable remote debugging", "[browser][chrome]") {
    LaunchOptions options;
    options.debug_port = 9444;
    options.viewport_width = 1024;
    options.viewport_height = 768;

    auto args = build_chrome_args(options, "/tmp/profile");
    CHECK(has_arg(args, "--remote-debugging-port=9444"));
    CHECK(has_arg(args, "--user-data-dir=/tmp/profile"));
    CHECK(has_arg(args, "--window-size=1024,768"));
    CHECK_FALSE(has_arg(args, "--headless=new"));
    CHECK(args.back() == "about:blank");
}

TEST_CASE("Chrome args honour headless and extra args", "[browser][chrome]") {
    LaunchOptions options;
    options.headless = true;
    options.extra_args = {"--proxy-server=localhost:8080"};

    auto args = build_chrome_args(options, "/tmp/p");
    CHECK(has_arg(args, "--headless=new"));
    CHECK(has_arg(args, "--proxy-server=localhost:8080"));
    CHECK(args.back() == "about:blank");
}

TEST_CASE("Page target selection skips non-page targets", "[browser][chrome]") {
    json targets = json::array({
        {{"type", "service_worker"}, {"webSocketDebuggerUrl", "ws://sw"}},
        {{"type", "page"}},
        {{"type", "page"}, {"webSocketDebuggerUrl", "ws://127.0.0.1:9222/devtools/page/A"}},
        {{"type", "page"}, {"webSocketDebuggerUrl", "ws://127.0.0.1:9222/devtools/page/B"}},
    });

    auto url = select_page_target(targets);
    REQUIRE(url.has_value());
    CHECK(*url == "ws://127.0.0.1:9222/devtools/page/A");

    CHECK_FALSE(select_page_target(json::array()).has_value());
    CHECK_FALSE(select_page_target(json::object()).has_value());
}

TEST_CASE("Key definitions cover named and printable keys", "[browser][keys]") {
    auto enter = key_definition("Enter");
    REQUIRE(enter.has_value());
    CHECK(enter->key_code == 13);
    CHECK(enter->text == "\r");

    auto a = key_definition("a");
    REQUIRE(a.has_value());
    CHECK(a->code == "KeyA");
    CHECK(a->key_code == 'A');
    CHECK(a->text == "a");

    auto seven = key_definition("7");
    REQUIRE(seven.has_value());
    CHECK(seven->code == "Digit7");

    auto f5 = key_definition("F5");
    REQUIRE(f5.has_value());
    CHECK(f5->key_code == 116);

    CHECK_FALSE(key_definition("F13").has_value());
    CHECK_FALSE(key_definition("NoSuchKey").has_value());
}

TEST_CASE("Modifier bits follow the CDP layout", "[browser][keys]") {
    CHECK(modifier_bit("Alt") == 1);
    CHECK(modifier_bit("Control") == 2);
    CHECK(modifier_bit("Meta") == 4);
    CHECK(modifier_bit("Shift") == 8);
    CHECK(modifier_bit("Enter") == 0);
}

TEST_CASE("Request capture keeps the last finished match", "[browser][capture]") {
    RequestCapture capture("/components/");
    capture.on_request({{"requestId", "1"}, {"request", {{"url", "https://x.dev/components/?page=1"}}}});
    capture.on_request({{"requestId", "2"}, {"request", {{"url", "https://x.dev/static/app.js"}}}});
    capture.on_request({{"requestId", "3"}, {"request", {{"url", "https://x.dev/components/?page=2"}}}});
    CHECK_FALSE(capture.captured().has_value());

    capture.on_finished({{"requestId", "1"}});
    REQUIRE(capture.captured().has_value());
    CHECK(*capture.captured() == "https://x.dev/components/?page=1");

    capture.on_finished({{"requestId", "2"}});
    capture.on_finished({{"requestId", "3"}});
    CHECK(*capture.captured() == "https://x.dev/components/?page=2");
}

TEST_CASE("Request capture ignores unknown and unfinished requests", "[browser][capture]") {
    RequestCapture capture("/api/");
    capture.on_request({{"requestId", "7"}, {"request", {{"url", "https://x.dev/api/items"}}}});
    capture.on_finished({{"requestId", "8"}});
    capture.on_finished(json::object());
    CHECK_FALSE(capture.captured().has_value());
}
