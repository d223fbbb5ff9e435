#include <catch2/catch_test_macros.hpp>

#include <boost/asio/io_context.hpp>

#include "pagewright/llm/openai.hpp"

using namespace pagewright::llm;

TEST_CASE("OpenAIProvider::create requires an API key", "[llm][openai]") {
    boost::asio::io_context ioc;
    pagewright::LlmConfig config;

    auto missing = OpenAIProvider::create(ioc, config);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == pagewright::ErrorCode::InvalidConfig);
    CHECK(missing.error().message() == "OpenAI API key not found");

    config.api_key = "sk-test";
    config.base_url = "http://localhost:8080/";
    auto provider = OpenAIProvider::create(ioc, config);
    REQUIRE(provider.has_value());
    CHECK((*provider)->name() == "openai");
}

TEST_CASE("build_request_body maps the completion request", "[llm][openai]") {
    CompletionRequest req;
    req.messages.push_back({"user", "Write a README"});
    req.max_tokens = 1500;
    req.temperature = 0.5;

    auto body = OpenAIProvider::build_request_body(req, "gpt-4o");
    CHECK(body["model"] == "gpt-4o");
    REQUIRE(body["messages"].size() == 1);
    CHECK(body["messages"][0]["role"] == "user");
    CHECK(body["messages"][0]["content"] == "Write a README");
    CHECK(body["max_tokens"] == 1500);
    CHECK(body["temperature"] == 0.5);

    SECTION("explicit model wins and unset limits are omitted") {
        CompletionRequest bare;
        bare.model = "gpt-4o-mini";
        auto j = OpenAIProvider::build_request_body(bare, "gpt-4o");
        CHECK(j["model"] == "gpt-4o-mini");
        CHECK_FALSE(j.contains("max_tokens"));
        CHECK_FALSE(j.contains("temperature"));
    }
}

TEST_CASE("parse_response extracts content and usage", "[llm][openai]") {
    auto parsed = OpenAIProvider::parse_response(R"({
        "model": "gpt-4o-2024-08-06",
        "choices": [{"message": {"role": "assistant", "content": "# Title"},
                     "finish_reason": "stop"}],
        "usage": {"prompt_tokens": 120, "completion_tokens": 30}
    })");

    REQUIRE(parsed.has_value());
    CHECK(parsed->content == "# Title");
    CHECK(parsed->model == "gpt-4o-2024-08-06");
    CHECK(parsed->stop_reason == "stop");
    CHECK(parsed->input_tokens == 120);
    CHECK(parsed->output_tokens == 30);
}

TEST_CASE("parse_response rejects malformed bodies", "[llm][openai]") {
    auto not_json = OpenAIProvider::parse_response("<html>bad gateway</html>");
    REQUIRE_FALSE(not_json.has_value());
    CHECK(not_json.error().code() == pagewright::ErrorCode::SerializationError);

    auto no_choices = OpenAIProvider::parse_response(R"({"choices": []})");
    REQUIRE_FALSE(no_choices.has_value());
    CHECK(no_choices.error().code() == pagewright::ErrorCode::ProviderError);
}

TEST_CASE("parse_response tolerates null metadata", "[llm][openai]") {
    auto parsed = OpenAIProvider::parse_response(R"({
        "model": null,
        "choices": [{"message": {"content": "body"}, "finish_reason": null}],
        "usage": null
    })");

    REQUIRE(parsed.has_value());
    CHECK(parsed->content == "body");
    CHECK(parsed->model.empty());
    CHECK(parsed->stop_reason.empty());
    CHECK(parsed->input_tokens == 0);

    auto null_counts = OpenAIProvider::parse_response(R"({
        "choices": [{"message": {"content": null}}],
        "usage": {"prompt_tokens": null, "completion_tokens": 5}
    })");
    REQUIRE(null_counts.has_value());
    CHECK(null_counts->content.empty());
    CHECK(null_counts->input_tokens == 0);
    CHECK(null_counts->output_tokens == 5);

    auto null_choice = OpenAIProvider::parse_response(R"({"choices": [null]})");
    REQUIRE_FALSE(null_choice.has_value());
    CHECK(null_choice.error().code() == pagewright::ErrorCode::ProviderError);
}
