#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "pagewright/browser/locator.hpp"
#include "pagewright/core/error.hpp"

namespace pagewright::workflow {

using json = nlohmann::json;

/// Points a step at an element: either a locator saved earlier in the run
/// (`element`) or an inline locator description (`locator`).
struct ElementRef {
    std::optional<std::string> element;
    json locator;

    [[nodiscard]] auto describe() const -> std::string;
};

/// State shared by the steps of one workflow run. Owned by the caller and
/// passed to every step explicitly.
struct PipelineContext {
    json vars = json::object();
    std::map<std::string, browser::Locator> locators;
    std::string run_id;

    /// Creates a context with a fresh run id.
    static auto create(json vars = json::object()) -> PipelineContext;

    /// Formats `text` against `vars`.
    [[nodiscard]] auto format(std::string_view text) const -> Result<std::string>;

    /// Turns an element reference into a concrete locator. Placeholders in
    /// CSS selectors are filled from `vars`.
    [[nodiscard]] auto resolve(const ElementRef& ref) const -> Result<browser::Locator>;

    void save_locator(const std::string& name, browser::Locator locator);
};

} // namespace pagewright::workflow
