#include "pagewright/browser/locator.hpp"
#include "pagewright/core/utils.hpp"

namespace pagewright::browser {

namespace {

// Implicit ARIA roles for the common native elements.
constexpr auto kRoleResolver = R"JS(
    const implicitRoles = {
        button: 'button, input[type=button], input[type=submit], input[type=reset]',
        link: 'a[href]',
        textbox: 'input:not([type]), input[type=text], input[type=email], input[type=search], input[type=tel], input[type=url], input[type=password], textarea',
        checkbox: 'input[type=checkbox]',
        radio: 'input[type=radio]',
        combobox: 'select',
        heading: 'h1, h2, h3, h4, h5, h6',
        img: 'img[alt]',
        list: 'ul, ol',
        listitem: 'li',
        option: 'option',
        navigation: 'nav',
        table: 'table',
    };
    const accessibleName = (el) => {
        const labelledBy = el.getAttribute('aria-labelledby');
        if (labelledBy) {
            const ref = document.getElementById(labelledBy);
            if (ref) return ref.textContent.trim();
        }
        return (el.getAttribute('aria-label')
            || (el.labels && el.labels.length ? el.labels[0].textContent : '')
            || el.getAttribute('alt')
            || el.getAttribute('title')
            || el.textContent
            || el.value
            || '').trim();
    };
    const byRole = (role, name) => {
        let selector = '[role="' + role + '"]';
        if (implicitRoles[role]) selector += ', ' + implicitRoles[role];
        const wanted = name === null ? null : name.toLowerCase();
        for (const el of document.querySelectorAll(selector)) {
            if (wanted === null || accessibleName(el).toLowerCase().includes(wanted)) return el;
        }
        return null;
    };
)JS";

constexpr auto kLabelResolver = R"JS(
    const byLabel = (text) => {
        const wanted = text.toLowerCase();
        for (const label of document.querySelectorAll('label')) {
            if (label.textContent.trim().toLowerCase().includes(wanted)) {
                if (label.control) return label.control;
                const forId = label.getAttribute('for');
                if (forId) {
                    const target = document.getElementById(forId);
                    if (target) return target;
                }
            }
        }
        for (const el of document.querySelectorAll('[aria-label]')) {
            if (el.getAttribute('aria-label').toLowerCase().includes(wanted)) return el;
        }
        return null;
    };
)JS";

} // anonymous namespace

auto Locator::css(std::string selector) -> Locator {
    Locator loc;
    loc.kind = LocatorKind::Css;
    loc.value = std::move(selector);
    return loc;
}

auto Locator::role(std::string role, std::optional<std::string> name) -> Locator {
    Locator loc;
    loc.kind = LocatorKind::Role;
    loc.value = std::move(role);
    loc.name = std::move(name);
    return loc;
}

auto Locator::label(std::string text) -> Locator {
    Locator loc;
    loc.kind = LocatorKind::Label;
    loc.value = std::move(text);
    return loc;
}

auto Locator::with_transform(std::string script) const -> Locator {
    Locator loc = *this;
    loc.transforms.push_back(std::move(script));
    return loc;
}

auto Locator::describe() const -> std::string {
    std::string out;
    switch (kind) {
        case LocatorKind::Css:
            out = "css=" + value;
            break;
        case LocatorKind::Role:
            out = "role=" + value;
            if (name) out += "[name=\"" + *name + "\"]";
            break;
        case LocatorKind::Label:
            out = "label=" + value;
            break;
    }
    for (const auto& t : transforms) {
        out += " >> " + t;
    }
    return out;
}

auto locator_from_json(const json& j) -> Result<Locator> {
    if (j.is_string()) {
        return Locator::css(j.get<std::string>());
    }
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Locator must be a string or an object"));
    }

    Locator loc;
    try {
        auto selector = j.value("selector", "");
        auto role = j.value("role", "");
        auto label = j.value("label", "");

        if (!selector.empty()) {
            loc = Locator::css(std::move(selector));
        } else if (!role.empty()) {
            std::optional<std::string> name;
            if (j.contains("name") && j["name"].is_string() &&
                !j["name"].get<std::string>().empty()) {
                name = j["name"].get<std::string>();
            }
            loc = Locator::role(std::move(role), std::move(name));
        } else if (!label.empty()) {
            loc = Locator::label(std::move(label));
        } else {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument,
                "Must provide at least one locator method (selector, role, or label)"));
        }

        if (j.contains("transforms")) {
            loc.transforms = j["transforms"].get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Malformed locator",
                                          e.what()));
    }
    return loc;
}

auto locator_to_json(const Locator& locator) -> json {
    json j;
    switch (locator.kind) {
        case LocatorKind::Css: j["selector"] = locator.value; break;
        case LocatorKind::Role:
            j["role"] = locator.value;
            if (locator.name) j["name"] = *locator.name;
            break;
        case LocatorKind::Label: j["label"] = locator.value; break;
    }
    if (!locator.transforms.empty()) {
        j["transforms"] = locator.transforms;
    }
    return j;
}

auto element_expression(const Locator& locator) -> std::string {
    std::string js = "(() => {";
    switch (locator.kind) {
        case LocatorKind::Css:
            js += " let el = document.querySelector(" + utils::js_string_literal(locator.value) + ");";
            break;
        case LocatorKind::Role:
            js += kRoleResolver;
            js += " let el = byRole(" + utils::js_string_literal(locator.value) + ", " +
                  (locator.name ? utils::js_string_literal(*locator.name) : std::string("null")) +
                  ");";
            break;
        case LocatorKind::Label:
            js += kLabelResolver;
            js += " let el = byLabel(" + utils::js_string_literal(locator.value) + ");";
            break;
    }
    for (const auto& transform : locator.transforms) {
        js += " if (el) { el = (" + transform + ")(el); }";
    }
    js += " return el instanceof Element ? el : null; })()";
    return js;
}

} // namespace pagewright::browser
