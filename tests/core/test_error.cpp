#include <catch2/catch_test_macros.hpp>

#include "pagewright/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        pagewright::Error err(pagewright::ErrorCode::NotFound, "element not found");
        CHECK(err.code() == pagewright::ErrorCode::NotFound);
        CHECK(err.message() == "element not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "element not found");
    }

    SECTION("error with detail") {
        pagewright::Error err(pagewright::ErrorCode::BrowserError,
                              "Page.navigate failed", "net::ERR_NAME_NOT_RESOLVED");
        CHECK(err.code() == pagewright::ErrorCode::BrowserError);
        CHECK(err.detail() == "net::ERR_NAME_NOT_RESOLVED");
        CHECK(err.what() == "Page.navigate failed: net::ERR_NAME_NOT_RESOLVED");
    }
}

TEST_CASE("Errors compare by code, message and detail", "[error]") {
    auto a = pagewright::make_error(pagewright::ErrorCode::Timeout, "slow", "5s");
    auto b = pagewright::make_error(pagewright::ErrorCode::Timeout, "slow", "5s");
    auto c = pagewright::make_error(pagewright::ErrorCode::Timeout, "slow");

    CHECK(a == b);
    CHECK_FALSE(a == c);
}

TEST_CASE("Result type success and error", "[error]") {
    pagewright::Result<int> ok = 42;
    REQUIRE(ok.has_value());
    CHECK(*ok == 42);

    pagewright::Result<int> bad = std::unexpected(
        pagewright::make_error(pagewright::ErrorCode::InvalidArgument, "bad value"));
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code() == pagewright::ErrorCode::InvalidArgument);
}

TEST_CASE("make_fail converts into any Result", "[error]") {
    pagewright::Result<std::string> text =
        pagewright::make_fail(pagewright::make_error(pagewright::ErrorCode::IoError, "disk full"));
    REQUIRE_FALSE(text.has_value());
    CHECK(text.error().message() == "disk full");

    pagewright::VoidResult nothing =
        pagewright::make_fail(pagewright::make_error(pagewright::ErrorCode::QueueClosed, "closed"));
    REQUIRE_FALSE(nothing.has_value());
    CHECK(nothing.error().code() == pagewright::ErrorCode::QueueClosed);

    CHECK(pagewright::ok_result().has_value());
}

TEST_CASE("error_code_to_string names every code", "[error]") {
    using pagewright::ErrorCode;
    using pagewright::error_code_to_string;

    CHECK(error_code_to_string(ErrorCode::InvalidState) == "INVALID_STATE");
    CHECK(error_code_to_string(ErrorCode::OperationFailed) == "OPERATION_FAILED");
    CHECK(error_code_to_string(ErrorCode::QueueClosed) == "QUEUE_CLOSED");
    CHECK(error_code_to_string(ErrorCode::AssertionFailed) == "ASSERTION_FAILED");
    CHECK(error_code_to_string(static_cast<ErrorCode>(999)) == "UNKNOWN");
}
