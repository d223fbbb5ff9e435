#include "pagewright/llm/openai.hpp"
#include "pagewright/core/logger.hpp"

namespace pagewright::llm {

namespace {

constexpr auto kDefaultBaseUrl = "https://api.openai.com";
constexpr auto kChatPath = "/v1/chat/completions";

auto make_http_config(const LlmConfig& config) -> infra::HttpClientConfig {
    infra::HttpClientConfig http;
    http.base_url = config.base_url.value_or(kDefaultBaseUrl);
    while (!http.base_url.empty() && http.base_url.back() == '/') {
        http.base_url.pop_back();
    }
    http.timeout_seconds = config.timeout_seconds;
    http.default_headers = {
        {"Authorization", "Bearer " + config.api_key},
    };
    return http;
}

} // anonymous namespace

auto OpenAIProvider::create(boost::asio::io_context& ioc, const LlmConfig& config)
    -> Result<std::unique_ptr<OpenAIProvider>> {
    if (config.api_key.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "OpenAI API key not found",
            "Set llm.api_key in config or the OPENAI_API_KEY environment variable"));
    }
    return std::make_unique<OpenAIProvider>(ioc, config);
}

OpenAIProvider::OpenAIProvider(boost::asio::io_context& ioc, const LlmConfig& config)
    : default_model_(config.model.empty() ? "gpt-4o" : config.model),
      http_(ioc, make_http_config(config)) {
    LOG_INFO("OpenAI provider initialized (model: {}, base: {})", default_model_,
             http_.base_url());
}

OpenAIProvider::~OpenAIProvider() = default;

auto OpenAIProvider::name() const -> std::string_view {
    return "openai";
}

auto OpenAIProvider::build_request_body(const CompletionRequest& req,
                                        std::string_view default_model) -> json {
    json body;
    body["model"] = req.model.empty() ? std::string(default_model) : req.model;

    json messages = json::array();
    for (const auto& msg : req.messages) {
        messages.push_back({{"role", msg.role}, {"content", msg.content}});
    }
    body["messages"] = std::move(messages);

    if (req.max_tokens) {
        body["max_tokens"] = *req.max_tokens;
    }
    if (req.temperature) {
        body["temperature"] = *req.temperature;
    }
    return body;
}

auto OpenAIProvider::parse_response(const std::string& body) -> Result<CompletionResponse> {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Failed to parse OpenAI response", e.what()));
    }

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        return std::unexpected(make_error(ErrorCode::ProviderError,
                                          "OpenAI response has no choices", body));
    }

    const auto& choice = j["choices"][0];
    if (!choice.is_object()) {
        return std::unexpected(make_error(ErrorCode::ProviderError,
                                          "OpenAI response choice is not an object", body));
    }

    CompletionResponse response;
    if (j.contains("model") && j["model"].is_string()) {
        response.model = j["model"].get<std::string>();
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        response.stop_reason = choice["finish_reason"].get<std::string>();
    }

    if (choice.contains("message") && choice["message"].is_object() &&
        choice["message"].contains("content") && choice["message"]["content"].is_string()) {
        response.content = choice["message"]["content"].get<std::string>();
    }

    if (j.contains("usage") && j["usage"].is_object()) {
        const auto& usage = j["usage"];
        if (usage.contains("prompt_tokens") && usage["prompt_tokens"].is_number_integer()) {
            response.input_tokens = usage["prompt_tokens"].get<int>();
        }
        if (usage.contains("completion_tokens") && usage["completion_tokens"].is_number_integer()) {
            response.output_tokens = usage["completion_tokens"].get<int>();
        }
    }
    return response;
}

auto OpenAIProvider::complete(CompletionRequest req) -> awaitable<Result<CompletionResponse>> {
    auto body = build_request_body(req, default_model_);
    LOG_DEBUG("OpenAI complete request: model={}", body.value("model", ""));

    auto result = co_await http_.post(kChatPath, body.dump());
    if (!result) {
        co_return make_fail(make_error(result.error().code(), "OpenAI API request failed",
                                       result.error().what()));
    }

    const auto& http_resp = result.value();
    if (!http_resp.is_success()) {
        std::string detail = http_resp.body;
        try {
            auto err_json = json::parse(http_resp.body);
            if (err_json.contains("error") && err_json["error"].is_object() &&
                err_json["error"].contains("message") &&
                err_json["error"]["message"].is_string()) {
                detail = err_json["error"]["message"].get<std::string>();
            }
        } catch (const json::parse_error&) {
            // Keep the raw body as detail.
        }
        co_return make_fail(make_error(
            ErrorCode::ProviderError,
            "OpenAI API error (HTTP " + std::to_string(http_resp.status) + ")", detail));
    }

    auto parsed = parse_response(http_resp.body);
    if (parsed) {
        LOG_DEBUG("OpenAI response: {} prompt / {} completion tokens", parsed->input_tokens,
                  parsed->output_tokens);
    }
    co_return parsed;
}

} // namespace pagewright::llm
