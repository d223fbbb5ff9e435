#include "pagewright/workflow/template.hpp"
#include "pagewright/core/utils.hpp"

namespace pagewright::workflow {

auto lookup_var(const json& vars, std::string_view path) -> const json* {
    const json* node = &vars;
    for (const auto& segment : utils::split(path, '.')) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(segment);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

auto format_template(std::string_view text, const json& vars) -> Result<std::string> {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '}') {
            if (i + 1 < text.size() && text[i + 1] == '}') {
                out += '}';
                ++i;
                continue;
            }
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Single '}' encountered in template",
                                              std::string(text)));
        }
        if (c != '{') {
            out += c;
            continue;
        }
        if (i + 1 < text.size() && text[i + 1] == '{') {
            out += '{';
            ++i;
            continue;
        }

        auto close = text.find('}', i + 1);
        if (close == std::string_view::npos) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Single '{' encountered in template",
                                              std::string(text)));
        }
        auto name = utils::trim(text.substr(i + 1, close - i - 1));
        if (name.empty() || name.find('{') != std::string::npos) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Invalid placeholder in template",
                                              std::string(text)));
        }

        const json* value = lookup_var(vars, name);
        if (value == nullptr) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Unknown template variable", name));
        }
        out += value->is_string() ? value->get<std::string>() : value->dump();
        i = close;
    }
    return out;
}

} // namespace pagewright::workflow
