#pragma once

// fontbridge/templates.hpp — Per-operation host scripts.
//
// Every template runs inside the host interpreter, looks up the current font,
// performs one operation and writes {"success": ..., "data"|"error": ...} as
// JSON to sys.argv[-1]. Caller values enter only through {{placeholders}}
// bound at module level before any host API is touched.

#include <string>
#include <vector>

#include "fontbridge/script_template.hpp"

namespace fontbridge::templates {

// Names of every available template, in catalog order.
const std::vector<std::string> &names();

// Throws UnknownOperationError for names not in names().
const ScriptTemplate &get(const std::string &name);

} // namespace fontbridge::templates
