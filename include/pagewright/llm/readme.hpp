#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "pagewright/catalog/catalog.hpp"
#include "pagewright/core/error.hpp"
#include "pagewright/llm/provider.hpp"

namespace pagewright::llm {

struct ReadmeOptions {
    std::string model = "gpt-4o";
    int max_tokens = 1500;
    double temperature = 0.5;
};

/// Prompt asking for a README that follows `readme_template`, describes the
/// category's components and references the screenshots.
auto build_readme_prompt(std::string_view readme_template, const json& category_info,
                         const std::vector<std::string>& screenshot_links) -> std::string;

/// Removes a Markdown code fence wrapped around the whole text
/// ("```markdown ... ```"); anything else is returned unchanged.
auto strip_code_fence(std::string_view text) -> std::string;

/// Drafts README files for component categories through a chat provider.
class ReadmeGenerator {
public:
    ReadmeGenerator(std::shared_ptr<Provider> provider, ReadmeOptions options = {});

    auto generate(const catalog::CategoryData& data) -> awaitable<Result<std::string>>;

    [[nodiscard]] auto options() const -> const ReadmeOptions& { return options_; }

private:
    std::shared_ptr<Provider> provider_;
    ReadmeOptions options_;
};

/// GETs a text document (e.g. a raw README template) from an absolute URL.
/// A non-2xx status is an error carrying the status code.
auto fetch_text(boost::asio::io_context& ioc, std::string_view url, int timeout_seconds = 30)
    -> awaitable<Result<std::string>>;

} // namespace pagewright::llm
