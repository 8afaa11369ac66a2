#pragma once

// fontbridge/operations.hpp — Tool/resource catalog and dispatch.
//
// call_tool() and read_resource() turn a named operation plus caller
// arguments into a rendered template and hand it to the bridge:
//
//   size check → argument validation → template render → bridge.execute
//
// Rejected input never reaches the host: ValidationError and RequestSizeError
// are converted to failure results here. Unknown names throw
// UnknownOperationError so the RPC layer can answer with a protocol error.

#include <string>
#include <vector>

#include "fontbridge/bridge.hpp"
#include "fontbridge/jsonlite.hpp"
#include "fontbridge/types.hpp"

namespace fontbridge {

struct ToolSpec {
  std::string name;
  std::string description;
  jsonlite::Value input_schema;
};

struct ResourceSpec {
  std::string uri;
  std::string name;
  std::string description;
  std::string mime_type{"application/json"};
};

const std::vector<ToolSpec> &tool_catalog();
const std::vector<ResourceSpec> &resource_catalog();

jsonlite::Value tool_to_value(const ToolSpec &tool);
jsonlite::Value resource_to_value(const ResourceSpec &resource);

constexpr const char *kGlyphResourcePrefix = "fontlab://glyph/";
constexpr const char *kStatsResourceUri = "fontbridge://server/stats";

// Validates args for the named operation (any templates::names() entry) and
// renders its script. Throws ValidationError, or UnknownOperationError for
// names without a template.
std::string build_tool_script(const std::string &name, const jsonlite::Value &args);

// Percent-decodes a URI component. Throws ValidationError("uri", ...) on a
// truncated or non-hex escape.
std::string percent_decode(const std::string &text);

class OperationDispatcher {
public:
  explicit OperationDispatcher(ExecutionBridge &bridge) : bridge_(bridge) {}

  ExecutionResult call_tool(const std::string &name, const jsonlite::Value &args);
  ExecutionResult read_resource(const std::string &uri);


private:
  ExecutionResult run_template(const std::string &operation,
                               const jsonlite::Value &args);
  ExecutionResult stats_snapshot() const;

  ExecutionBridge &bridge_;
};

} // namespace fontbridge
