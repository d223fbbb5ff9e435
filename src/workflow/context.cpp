#include "pagewright/workflow/context.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"
#include "pagewright/workflow/template.hpp"

namespace pagewright::workflow {

auto ElementRef::describe() const -> std::string {
    if (element) {
        return "element '" + *element + "'";
    }
    return locator.dump();
}

auto PipelineContext::create(json vars) -> PipelineContext {
    PipelineContext ctx;
    ctx.vars = vars.is_object() ? std::move(vars) : json::object();
    ctx.run_id = utils::generate_uuid();
    return ctx;
}

auto PipelineContext::format(std::string_view text) const -> Result<std::string> {
    return format_template(text, vars);
}

auto PipelineContext::resolve(const ElementRef& ref) const -> Result<browser::Locator> {
    if (ref.element) {
        auto it = locators.find(*ref.element);
        if (it == locators.end()) {
            return std::unexpected(make_error(ErrorCode::NotFound, "Unknown element",
                                              *ref.element));
        }
        return it->second;
    }

    if (ref.locator.is_null()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Must provide at least one locator method (selector, role, or label)"));
    }

    auto locator = browser::locator_from_json(ref.locator);
    if (!locator) {
        return std::unexpected(locator.error());
    }
    if (locator->kind == browser::LocatorKind::Css) {
        auto selector = format(locator->value);
        if (!selector) {
            return std::unexpected(selector.error());
        }
        locator->value = std::move(*selector);
    }
    return locator;
}

void PipelineContext::save_locator(const std::string& name, browser::Locator locator) {
    LOG_DEBUG("[{}] saved element '{}' = {}", run_id, name, locator.describe());
    locators.insert_or_assign(name, std::move(locator));
}

} // namespace pagewright::workflow
