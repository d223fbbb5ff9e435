#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pagewright/core/error.hpp"

namespace pagewright::browser {

using json = nlohmann::json;

enum class LocatorKind {
    Css,
    Role,
    Label,
};

/// Describes how to find one element on the active page.
///
/// A locator is a plain value; it is resolved against the live DOM each time
/// an operation uses it. `transforms` are JavaScript functions
/// (e.g. "node => node.closest('li')") applied in order to the resolved
/// element to reach a related one.
struct Locator {
    LocatorKind kind = LocatorKind::Css;
    std::string value;
    std::optional<std::string> name;
    std::vector<std::string> transforms;

    static auto css(std::string selector) -> Locator;
    static auto role(std::string role, std::optional<std::string> name = std::nullopt) -> Locator;
    static auto label(std::string text) -> Locator;

    [[nodiscard]] auto with_transform(std::string script) const -> Locator;

    /// Human-readable form for logs and error details.
    [[nodiscard]] auto describe() const -> std::string;

    friend auto operator==(const Locator&, const Locator&) -> bool = default;
};

/// Parses `{"selector": ...}`, `{"role": ..., "name": ...}` or
/// `{"label": ...}`, plus optional `"transforms": [...]`. The selector wins
/// when several are given.
auto locator_from_json(const json& j) -> Result<Locator>;
auto locator_to_json(const Locator& locator) -> json;

/// JavaScript expression that evaluates to the element or null.
auto element_expression(const Locator& locator) -> std::string;

} // namespace pagewright::browser
