#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "pagewright/core/error.hpp"

namespace pagewright::catalog {

using json = nlohmann::json;

/// Collects every component definition (an object carrying a "task" key)
/// from an arbitrarily nested API response, depth first. A component's own
/// members are not searched further.
auto flatten_components(const json& data) -> std::vector<json>;

/// First component whose "task" equals `name`, ignoring case.
auto find_component(const std::vector<json>& components, std::string_view name)
    -> std::optional<json>;

/// Components whose trimmed "category" equals `category`, ignoring case.
auto filter_category(const std::vector<json>& components, std::string_view category)
    -> std::vector<json>;

/// Input bundle for README drafting.
struct CategoryData {
    json category_info = json::array();
    std::string readme_template;
    std::vector<std::string> screenshot_links;
};

/// Parses `{"category_info": [...], "readme_template": "...",
/// "screenshot_links": [...]}`. Missing keys take their empty defaults; a
/// non-string template is stringified.
auto parse_category_data(std::string_view text) -> Result<CategoryData>;
auto parse_category_data(const json& j) -> Result<CategoryData>;

} // namespace pagewright::catalog
