#include "pagewright/llm/readme.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"
#include "pagewright/infra/http_client.hpp"

namespace pagewright::llm {

auto build_readme_prompt(std::string_view readme_template, const json& category_info,
                         const std::vector<std::string>& screenshot_links) -> std::string {
    std::string prompt;
    prompt +=
        "You are a documentation generator. Generate a new README in Markdown format for a "
        "component library using the following details. The README must follow the style and "
        "structure of the provided template. It should be concise, clear, and natural, without "
        "unnecessary filler or signs of AI generation.\n\n";
    prompt += "Template (Markdown):\n";
    prompt += readme_template;
    prompt += "\n\n";
    prompt += "Category Information (components library details):\n";
    prompt += category_info.dump(2);
    prompt += "\n\n";
    prompt += "Screenshot Links for the first two components:\n";
    prompt += json(screenshot_links).dump(2);
    prompt += "\n\n";
    prompt +=
        "Using the above information, generate a new README in Markdown format that summarizes "
        "the key features of the library, describes its main components, and includes the "
        "provided screenshot links as visual references. "
        "Do not enclose the result within Markdown code fences such as ```markdown```. "
        "You must strictly adhere to the given template, maintaining its exact structure, "
        "paragraph organization, and formatting. "
        "Do not alter the writing style or add any unnecessary content.";
    return prompt;
}

auto strip_code_fence(std::string_view text) -> std::string {
    auto trimmed = utils::trim(text);
    if (!trimmed.starts_with("```") || trimmed.size() < 6 || !trimmed.ends_with("```")) {
        return std::string(text);
    }

    auto first_newline = trimmed.find('\n');
    if (first_newline == std::string::npos) {
        return std::string(text);
    }
    // The opening line may carry a language tag; it must not hold content.
    auto info = utils::trim(std::string_view(trimmed).substr(3, first_newline - 3));
    if (info.find(' ') != std::string::npos) {
        return std::string(text);
    }

    auto inner = std::string_view(trimmed).substr(first_newline + 1);
    inner.remove_suffix(3);
    auto out = std::string(inner);
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
        out.pop_back();
    }
    return out + "\n";
}

ReadmeGenerator::ReadmeGenerator(std::shared_ptr<Provider> provider, ReadmeOptions options)
    : provider_(std::move(provider)), options_(std::move(options)) {}

auto ReadmeGenerator::generate(const catalog::CategoryData& data)
    -> awaitable<Result<std::string>> {
    if (!provider_) {
        co_return make_fail(make_error(ErrorCode::InvalidConfig, "No LLM provider configured"));
    }

    auto prompt = build_readme_prompt(data.readme_template, data.category_info,
                                      data.screenshot_links);
    LOG_DEBUG("README prompt ({} chars):\n{}", prompt.size(), prompt);

    CompletionRequest req;
    req.model = options_.model;
    req.messages.push_back({"user", std::move(prompt)});
    req.max_tokens = options_.max_tokens;
    req.temperature = options_.temperature;

    auto response = co_await provider_->complete(std::move(req));
    if (!response) {
        co_return make_fail(response.error());
    }
    if (utils::trim(response->content).empty()) {
        co_return make_fail(make_error(ErrorCode::ProviderError,
                                       "Provider returned an empty README",
                                       std::string(provider_->name())));
    }

    LOG_INFO("Generated README ({} chars, {} output tokens)", response->content.size(),
             response->output_tokens);
    co_return strip_code_fence(response->content);
}

auto fetch_text(boost::asio::io_context& ioc, std::string_view url, int timeout_seconds)
    -> awaitable<Result<std::string>> {
    if (!url.starts_with("http://") && !url.starts_with("https://")) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "URL must be absolute http(s)", std::string(url)));
    }

    auto parts = utils::split_url(url);
    infra::HttpClient http(ioc, infra::HttpClientConfig{
                                    .base_url = parts.origin,
                                    .timeout_seconds = timeout_seconds,
                                });

    auto result = co_await http.get(parts.path);
    if (!result) {
        co_return make_fail(result.error());
    }
    if (!result->is_success()) {
        co_return make_fail(make_error(ErrorCode::ProtocolError, "Failed to fetch document",
                                       "status code: " + std::to_string(result->status) +
                                           " (" + std::string(url) + ")"));
    }

    LOG_INFO("Fetched {} bytes from {}", result->body.size(), std::string(url));
    co_return result->body;
}

} // namespace pagewright::llm
