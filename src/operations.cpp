#include "fontbridge/operations.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

#include "fontbridge/log.hpp"
#include "fontbridge/templates.hpp"
#include "fontbridge/validation.hpp"
#include "fontbridge/version.hpp"

namespace fontbridge {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

// ---------------------------------------------------------------------------
// Schema helpers
// ---------------------------------------------------------------------------

Value prop(const char *type, const char *description) {
  return Object{{"type", type}, {"description", description}};
}

Value number_prop(const char *description, double min, double max) {
  return Object{{"type", "number"},
                {"description", description},
                {"minimum", min},
                {"maximum", max}};
}

Value object_schema(Object properties, std::vector<std::string> required) {
  Object schema{{"type", "object"},
                {"properties", std::move(properties)},
                {"additionalProperties", false}};
  if (!required.empty()) {
    Array req;
    for (auto &r : required)
      req.emplace_back(std::move(r));
    schema["required"] = std::move(req);
  }
  return schema;
}

Value glyph_name_prop(const char *description) {
  Object p{{"type", "string"}, {"description", description}};
  p["minLength"] = 1;
  p["maxLength"] = rules::kGlyphNameMax;
  return p;
}

Value glyph_only_schema(const char *description) {
  return object_schema({{"name", glyph_name_prop(description)}}, {"name"});
}

std::vector<ToolSpec> build_tools() {
  std::vector<ToolSpec> t;

  t.push_back({"create_glyph", "Create a new glyph in the current font",
               object_schema(
                   {{"name", glyph_name_prop("Glyph name (e.g., 'A', 'B', 'space')")},
                    {"unicode", Object{{"type", "integer"},
                                       {"description", "Unicode code point (optional)"},
                                       {"minimum", 0},
                                       {"maximum", rules::kCodepointMax}}},
                    {"width", number_prop("Glyph width (optional, defaults to 600)",
                                          rules::kWidthMin, rules::kWidthMax)}},
                   {"name"})});

  t.push_back({"modify_glyph_width", "Modify the width of an existing glyph",
               object_schema({{"name", glyph_name_prop("Glyph name")},
                              {"width", number_prop("New width value", rules::kWidthMin,
                                                    rules::kWidthMax)}},
                             {"name", "width"})});

  t.push_back(
      {"transform_glyph", "Apply transformation to a glyph (scale, rotate, translate)",
       object_schema(
           {{"name", glyph_name_prop("Glyph name")},
            {"scale_x", number_prop("Horizontal scale factor (1.0 = no change)",
                                    rules::kScaleMin, rules::kScaleMax)},
            {"scale_y", number_prop("Vertical scale factor (1.0 = no change)",
                                    rules::kScaleMin, rules::kScaleMax)},
            {"rotate", number_prop("Rotation angle in degrees", rules::kRotateMin,
                                   rules::kRotateMax)},
            {"translate_x", number_prop("Horizontal translation", rules::kTranslateMin,
                                        rules::kTranslateMax)},
            {"translate_y", number_prop("Vertical translation", rules::kTranslateMin,
                                        rules::kTranslateMax)}},
           {"name"})});

  t.push_back({"update_font_info", "Update font metadata",
               object_schema({{"family_name", prop("string", "Font family name")},
                              {"style_name", prop("string", "Font style name")},
                              {"version", prop("string", "Font version")},
                              {"copyright", prop("string", "Copyright notice")}},
                             {})});

  Array formats;
  for (const auto &f : rules::export_formats())
    formats.emplace_back(f);
  t.push_back({"export_font", "Export the current font to a file",
               object_schema({{"path", prop("string", "Output file path")},
                              {"format", Object{{"type", "string"},
                                                {"description", "Export format"},
                                                {"enum", std::move(formats)},
                                                {"default", "otf"}}}},
                             {"path"})});

  t.push_back({"delete_glyph", "Delete a glyph from the current font",
               glyph_only_schema("Glyph name to delete")});

  t.push_back({"get_glyph", "Get detailed information about a specific glyph",
               glyph_only_schema("Glyph name")});

  t.push_back({"find_glyph_by_unicode", "Find a glyph by Unicode code point",
               object_schema({{"codepoint", Object{{"type", "integer"},
                                                   {"description", "Unicode code point"},
                                                   {"minimum", 0},
                                                   {"maximum", rules::kCodepointMax}}}},
                             {"codepoint"})});

  t.push_back({"search_glyphs", "Search glyphs by name pattern (* and ? wildcards)",
               object_schema({{"pattern", prop("string", "Glob pattern, e.g. 'a*'")}},
                             {"pattern"})});

  t.push_back({"get_glyph_metadata", "Get glyph note, tags and mark color",
               glyph_only_schema("Glyph name")});

  t.push_back({"get_kerning", "Get all kerning pairs from the current font",
               object_schema({}, {})});

  t.push_back({"get_glyph_contours", "Get contour information for a glyph",
               glyph_only_schema("Glyph name")});

  t.push_back({"get_glyph_paths", "Get path data with node coordinates for a glyph",
               glyph_only_schema("Glyph name")});

  t.push_back({"get_glyph_components", "Get component references in a glyph",
               glyph_only_schema("Glyph name")});

  t.push_back({"get_font_features", "Get the OpenType feature code of the current font",
               object_schema({}, {})});

  t.push_back({"get_glyph_classes", "Get all glyph classes defined in the font",
               object_schema({}, {})});

  return t;
}

// ---------------------------------------------------------------------------
// Argument access
// ---------------------------------------------------------------------------

class Args {
public:
  Args(const Value &args, std::initializer_list<const char *> allowed) {
    if (args.is_null())
      return;
    if (!args.is_object())
      throw ValidationError("arguments", "must be an object");
    obj_ = &std::get<Object>(args.v);
    const std::set<std::string> allow(allowed.begin(), allowed.end());
    for (const auto &[k, v] : *obj_)
      if (!allow.contains(k))
        throw ValidationError(k, "unknown argument");
  }

  // Missing keys and explicit nulls both read as absent.
  const Value *opt(const std::string &key) const {
    if (!obj_)
      return nullptr;
    const Value *v = jsonlite::find(*obj_, key);
    return (v && !v->is_null()) ? v : nullptr;
  }

  const Value &req(const std::string &key) const {
    const Value *v = opt(key);
    if (!v)
      throw ValidationError(key, "is required");
    return *v;
  }

private:
  const Object *obj_{nullptr};
};

void bind(Bindings &b, const std::string &name, const Value &v) {
  b.insert_or_assign(name, encode_literal(v));
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

Bindings bindings_for(const std::string &op, const Value &raw) {
  Bindings b;

  if (op == "get_current_font" || op == "list_glyphs" || op == "get_kerning" ||
      op == "get_font_features" || op == "get_glyph_classes") {
    Args a(raw, {});
  } else if (op == "get_glyph" || op == "get_glyph_metadata" ||
             op == "get_glyph_contours" || op == "get_glyph_paths" ||
             op == "get_glyph_components" || op == "delete_glyph") {
    Args a(raw, {"name"});
    bind(b, "glyph_name", validate_identifier_string(a.req("name"), "name"));
  } else if (op == "find_glyph_by_unicode") {
    Args a(raw, {"codepoint"});
    bind(b, "codepoint", validate_unicode_codepoint(a.req("codepoint"), "codepoint"));
  } else if (op == "search_glyphs") {
    Args a(raw, {"pattern"});
    bind(b, "pattern", validate_identifier_string(a.req("pattern"), "pattern",
                                                  rules::kSearchPatternMax));
  } else if (op == "create_glyph") {
    Args a(raw, {"name", "unicode", "width"});
    bind(b, "glyph_name", validate_identifier_string(a.req("name"), "name"));
    const Value *cp = a.opt("unicode");
    bind(b, "unicode",
         cp ? Value{validate_unicode_codepoint(*cp, "unicode")} : Value{nullptr});
    const Value *w = a.opt("width");
    bind(b, "width",
         w ? validate_numeric_range(*w, "width", rules::kWidthMin, rules::kWidthMax)
           : 600.0);
  } else if (op == "modify_glyph_width") {
    Args a(raw, {"name", "width"});
    bind(b, "glyph_name", validate_identifier_string(a.req("name"), "name"));
    bind(b, "width", validate_numeric_range(a.req("width"), "width", rules::kWidthMin,
                                            rules::kWidthMax));
  } else if (op == "transform_glyph") {
    Args a(raw, {"name", "scale_x", "scale_y", "rotate", "translate_x", "translate_y"});
    bind(b, "glyph_name", validate_identifier_string(a.req("name"), "name"));
    auto num = [&](const char *key, double def, double min, double max) {
      const Value *v = a.opt(key);
      bind(b, key, v ? validate_numeric_range(*v, key, min, max) : def);
    };
    num("scale_x", 1.0, rules::kScaleMin, rules::kScaleMax);
    num("scale_y", 1.0, rules::kScaleMin, rules::kScaleMax);
    num("rotate", 0.0, rules::kRotateMin, rules::kRotateMax);
    num("translate_x", 0.0, rules::kTranslateMin, rules::kTranslateMax);
    num("translate_y", 0.0, rules::kTranslateMin, rules::kTranslateMax);
  } else if (op == "update_font_info") {
    Args a(raw, {"family_name", "style_name", "version", "copyright"});
    Object updates;
    for (const char *key : {"family_name", "style_name", "version", "copyright"})
      if (const Value *v = a.opt(key))
        updates[key] = validate_string_length(*v, key, rules::kFontInfoFieldMax);
    bind(b, "updates", Value{std::move(updates)});
  } else if (op == "export_font") {
    Args a(raw, {"path", "format"});
    const std::string path = validate_export_path(a.req("path"));
    const Value *f = a.opt("format");
    const std::string format =
        f ? validate_choice(*f, "format", rules::export_formats()) : "otf";
    if (lower(std::filesystem::path(path).extension().string()) != "." + format)
      throw ValidationError("format", "does not match the path extension");
    bind(b, "path", path);
    bind(b, "format", format);
  } else {
    throw UnknownOperationError(op);
  }
  return b;
}

bool is_tool(const std::string &name) {
  const auto &tools = tool_catalog();
  return std::any_of(tools.begin(), tools.end(),
                     [&](const ToolSpec &t) { return t.name == name; });
}

ExecutionResult rejected(ExecutionBridge &bridge, const std::string &op,
                         const ValidationError &e) {
  bridge.stats().record_validation_rejection();
  log_event(LogLevel::warn, "security", "validation_rejected",
            {{"operation", Value{op}},
             {"field", Value{e.field()}},
             {"reason", Value{e.reason()}}});
  return ExecutionResult::failure(ErrorCode::validation_failed,
                                  "Validation error: " + e.field() + ": " + e.reason());
}

} // namespace

const std::vector<ToolSpec> &tool_catalog() {
  static const std::vector<ToolSpec> tools = build_tools();
  return tools;
}

const std::vector<ResourceSpec> &resource_catalog() {
  static const std::vector<ResourceSpec> resources = {
      {"fontlab://font/current", "Current Font",
       "Get information about the currently open font"},
      {"fontlab://font/current/glyphs", "Font Glyphs",
       "List all glyphs in the current font"},
      {"fontlab://font/info", "Font Info", "Get detailed font metadata and information"},
      {"fontlab://glyph/{name}", "Glyph Details",
       "Get detailed information about a specific glyph (use glyph name)"},
      {kStatsResourceUri, "Server Stats",
       "Execution counters, gate occupancy and version information"},
  };
  return resources;
}

jsonlite::Value tool_to_value(const ToolSpec &tool) {
  return Object{{"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}};
}

jsonlite::Value resource_to_value(const ResourceSpec &resource) {
  return Object{{"uri", resource.uri},
                {"name", resource.name},
                {"description", resource.description},
                {"mimeType", resource.mime_type}};
}

std::string build_tool_script(const std::string &name, const jsonlite::Value &args) {
  const ScriptTemplate &tpl = templates::get(name);
  return tpl.render(bindings_for(name, args));
}

std::string percent_decode(const std::string &text) {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      out += text[i];
      continue;
    }
    if (i + 2 >= text.size())
      throw ValidationError("uri", "truncated percent-escape");
    const int hi = hex(text[i + 1]);
    const int lo = hex(text[i + 2]);
    if (hi < 0 || lo < 0)
      throw ValidationError("uri", "invalid percent-escape");
    out += static_cast<char>(hi * 16 + lo);
    i += 2;
  }
  return out;
}

// ---------------------------------------------------------------------------
// OperationDispatcher
// ---------------------------------------------------------------------------

ExecutionResult OperationDispatcher::call_tool(const std::string &name,
                                               const jsonlite::Value &args) {
  if (!is_tool(name))
    throw UnknownOperationError(name);
  return run_template(name, args);
}

ExecutionResult OperationDispatcher::read_resource(const std::string &uri) {
  if (uri == "fontlab://font/current" || uri == "fontlab://font/info")
    return run_template("get_current_font", Value{});
  if (uri == "fontlab://font/current/glyphs")
    return run_template("list_glyphs", Value{});
  if (uri == kStatsResourceUri)
    return stats_snapshot();

  const std::string prefix = kGlyphResourcePrefix;
  if (uri.size() > prefix.size() && uri.compare(0, prefix.size(), prefix) == 0) {
    std::string name;
    try {
      name = percent_decode(uri.substr(prefix.size()));
    } catch (const ValidationError &e) {
      return rejected(bridge_, "get_glyph", e);
    }
    return run_template("get_glyph", Object{{"name", name}});
  }
  throw UnknownOperationError(uri);
}

ExecutionResult OperationDispatcher::run_template(const std::string &operation,
                                                  const jsonlite::Value &args) {
  std::string script;
  try {
    validate_request_size(args, bridge_.config().max_request_bytes);
    script = build_tool_script(operation, args);
  } catch (const ValidationError &e) {
    return rejected(bridge_, operation, e);
  } catch (const RequestSizeError &e) {
    bridge_.stats().record_request_too_large();
    log_event(LogLevel::warn, "security", "request_too_large",
              {{"operation", Value{operation}},
               {"bytes", e.actual_bytes()},
               {"max_bytes", e.max_bytes()}});
    return ExecutionResult::failure(ErrorCode::request_too_large,
                                    "Request payload too large");
  }
  return bridge_.execute(script, std::nullopt, operation);
}

ExecutionResult OperationDispatcher::stats_snapshot() const {
  const ConcurrencyGate &gate = bridge_.gate();
  Object gate_v{{"capacity", gate.capacity()},
                {"in_flight", gate.in_flight()},
                {"waiting", gate.waiting()},
                {"peak", gate.peak()},
                {"contention_count", gate.contention_count()},
                {"total_acquired", gate.total_acquired()}};
  Object data{{"executions", bridge_.stats().to_value()},
              {"gate", std::move(gate_v)},
              {"version", version::manifest_to_value(version::current_manifest())},
              {"host_name_plausible", bridge_.host().name_plausible()}};
  return ExecutionResult::success(Value{std::move(data)});
}

} // namespace fontbridge
