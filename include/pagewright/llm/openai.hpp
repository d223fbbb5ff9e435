#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <boost/asio.hpp>

#include "pagewright/core/config.hpp"
#include "pagewright/infra/http_client.hpp"
#include "pagewright/llm/provider.hpp"

namespace pagewright::llm {

/// OpenAI Chat Completions provider (POST /v1/chat/completions).
/// Works with OpenAI-compatible servers through `base_url`.
class OpenAIProvider final : public Provider {
public:
    /// Fails with InvalidConfig when no API key is configured.
    static auto create(boost::asio::io_context& ioc, const LlmConfig& config)
        -> Result<std::unique_ptr<OpenAIProvider>>;

    OpenAIProvider(boost::asio::io_context& ioc, const LlmConfig& config);
    ~OpenAIProvider() override;

    OpenAIProvider(const OpenAIProvider&) = delete;
    OpenAIProvider& operator=(const OpenAIProvider&) = delete;

    auto complete(CompletionRequest req) -> awaitable<Result<CompletionResponse>> override;

    [[nodiscard]] auto name() const -> std::string_view override;

    static auto build_request_body(const CompletionRequest& req, std::string_view default_model)
        -> json;
    static auto parse_response(const std::string& body) -> Result<CompletionResponse>;

private:
    std::string default_model_;
    infra::HttpClient http_;
};

} // namespace pagewright::llm
