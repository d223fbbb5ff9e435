#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "pagewright/core/error.hpp"

namespace pagewright::llm {

using json = nlohmann::json;
using boost::asio::awaitable;

struct ChatMessage {
    std::string role;  // "system", "user", "assistant"
    std::string content;
};

struct CompletionRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
};

struct CompletionResponse {
    std::string content;
    std::string model;
    int input_tokens = 0;
    int output_tokens = 0;
    std::string stop_reason;
};

/// A chat-completion backend.
class Provider {
public:
    virtual ~Provider() = default;

    virtual auto complete(CompletionRequest req) -> awaitable<Result<CompletionResponse>> = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

} // namespace pagewright::llm
