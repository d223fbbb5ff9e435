#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "pagewright/core/error.hpp"

namespace pagewright::workflow {

using json = nlohmann::json;

/// Substitutes `{name}` placeholders from `vars`.
///
/// `name` may be a dotted path into nested objects ("comp.url"). String
/// values are inserted as-is, anything else as compact JSON. `{{` and `}}`
/// produce literal braces. An unknown name, an empty name or an unmatched
/// brace is an InvalidArgument error.
auto format_template(std::string_view text, const json& vars) -> Result<std::string>;

/// Looks up a dotted path in `vars`; nullptr when any segment is missing.
auto lookup_var(const json& vars, std::string_view path) -> const json*;

} // namespace pagewright::workflow
