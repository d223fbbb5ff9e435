#include "pagewright/catalog/catalog.hpp"
#include "pagewright/core/utils.hpp"

namespace pagewright::catalog {

namespace {

void collect(const json& node, std::vector<json>& out) {
    if (node.is_array()) {
        for (const auto& item : node) {
            collect(item, out);
        }
    } else if (node.is_object()) {
        if (node.contains("task")) {
            out.push_back(node);
            return;
        }
        for (const auto& [key, value] : node.items()) {
            collect(value, out);
        }
    }
}

auto string_field(const json& obj, const char* key) -> std::string {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // anonymous namespace

auto flatten_components(const json& data) -> std::vector<json> {
    std::vector<json> out;
    collect(data, out);
    return out;
}

auto find_component(const std::vector<json>& components, std::string_view name)
    -> std::optional<json> {
    auto wanted = utils::to_lower(name);
    for (const auto& comp : components) {
        if (utils::to_lower(string_field(comp, "task")) == wanted) {
            return comp;
        }
    }
    return std::nullopt;
}

auto filter_category(const std::vector<json>& components, std::string_view category)
    -> std::vector<json> {
    auto wanted = utils::to_lower(utils::trim(category));
    std::vector<json> out;
    for (const auto& comp : components) {
        if (utils::to_lower(utils::trim(string_field(comp, "category"))) == wanted) {
            out.push_back(comp);
        }
    }
    return out;
}

auto parse_category_data(std::string_view text) -> Result<CategoryData> {
    try {
        return parse_category_data(json::parse(text));
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Invalid category data JSON", e.what()));
    }
}

auto parse_category_data(const json& j) -> Result<CategoryData> {
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Category data must be a JSON object"));
    }

    CategoryData data;
    if (j.contains("category_info")) {
        data.category_info = j["category_info"];
    }
    if (j.contains("readme_template")) {
        const auto& t = j["readme_template"];
        data.readme_template = t.is_string() ? t.get<std::string>() : t.dump();
    }
    if (j.contains("screenshot_links")) {
        const auto& links = j["screenshot_links"];
        if (!links.is_array()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "screenshot_links must be an array"));
        }
        for (const auto& link : links) {
            data.screenshot_links.push_back(link.is_string() ? link.get<std::string>()
                                                             : link.dump());
        }
    }
    return data;
}

} // namespace pagewright::catalog
