#include "fontbridge/templates.hpp"

#include <map>

#include "fontbridge/types.hpp"

namespace fontbridge::templates {

namespace {

constexpr const char *kHeader = R"PY(import json
import sys

)PY";

constexpr const char *kOpenFont = R"PY(
try:
    from fontlab import flWorkspace
    font = flWorkspace.instance().currentFont()
    if font is None:
        result = {"success": False, "error": "No font is currently open"}
    else:
)PY";

constexpr const char *kFooter = R"PY(except Exception as e:
    result = {"success": False, "error": str(e)}

with open(sys.argv[-1], "w") as f:
    json.dump(result, f)
)PY";

// Glyph lookups share this preamble. It leaves `glyph` bound or sets a
// not-found result.
constexpr const char *kFindGlyph = R"PY(        glyph = font.findGlyph(glyph_name)
        if glyph is None:
            result = {"success": False, "error": f"Glyph not found: {glyph_name}"}
        else:
)PY";

// params: module-level bindings. body: indented by 8 spaces, or by 12 under
// the glyph lookup preamble when finds_glyph is set.
std::string assemble(const std::string &params, const std::string &body,
                     bool finds_glyph) {
  std::string out = kHeader;
  out += params;
  out += kOpenFont;
  if (finds_glyph)
    out += kFindGlyph;
  out += body;
  out += kFooter;
  return out;
}

struct Entry {
  const char *name;
  const char *params;
  const char *body;
  bool finds_glyph{false};
};

const Entry kEntries[] = {
    {"get_current_font", "",
     R"PY(        info = font.info
        result = {"success": True, "data": {
            "family_name": info.familyName or "",
            "style_name": info.styleName or "",
            "full_name": info.fullName or "",
            "version": info.versionMajor or 1,
            "glyph_count": len(font.glyphs),
            "units_per_em": info.unitsPerEm or 1000,
        }}
)PY"},

    {"list_glyphs", "",
     R"PY(        glyphs = []
        for glyph in font.glyphs:
            glyphs.append({
                "name": glyph.name,
                "unicode": glyph.unicode if glyph.unicode else None,
                "width": glyph.width,
                "has_contours": len(glyph.layers[0].shapes) > 0,
            })
        result = {"success": True, "data": {"glyphs": glyphs, "count": len(glyphs)}}
)PY"},

    {"get_glyph", "glyph_name = {{glyph_name}}\n",
     R"PY(            layer = glyph.layers[0]
            box = layer.boundingBox
            result = {"success": True, "data": {
                "name": glyph.name,
                "unicode": glyph.unicode if glyph.unicode else None,
                "width": glyph.width,
                "height": layer.advanceHeight if hasattr(layer, "advanceHeight") else 0,
                "bounds": {
                    "x": box.x() if box else 0,
                    "y": box.y() if box else 0,
                    "width": box.width() if box else 0,
                    "height": box.height() if box else 0,
                },
                "contour_count": len(layer.shapes),
            }}
)PY", true},

    {"find_glyph_by_unicode", "codepoint = {{codepoint}}\n",
     R"PY(        glyph = None
        for g in font.glyphs:
            if g.unicode == codepoint:
                glyph = g
                break
        if glyph is None:
            result = {"success": False, "error": f"No glyph found with Unicode U+{codepoint:04X}"}
        else:
            layer = glyph.layers[0] if glyph.layers else None
            result = {"success": True, "data": {
                "name": glyph.name,
                "unicode": glyph.unicode,
                "width": glyph.width,
                "height": layer.advanceHeight if layer and hasattr(layer, "advanceHeight") else 0,
                "has_contours": len(layer.shapes) > 0 if layer else False,
            }}
)PY"},

    {"search_glyphs", "pattern = {{pattern}}\n",
     R"PY(        import fnmatch
        matches = []
        for glyph in font.glyphs:
            if fnmatch.fnmatch(glyph.name, pattern):
                matches.append({
                    "name": glyph.name,
                    "unicode": glyph.unicode if glyph.unicode else None,
                    "width": glyph.width,
                })
        result = {"success": True, "data": {
            "pattern": pattern,
            "matches": matches,
            "count": len(matches),
        }}
)PY"},

    {"get_glyph_metadata", "glyph_name = {{glyph_name}}\n",
     R"PY(            result = {"success": True, "data": {
                "name": glyph.name,
                "note": glyph.note if getattr(glyph, "note", None) else "",
                "tags": list(glyph.tags) if getattr(glyph, "tags", None) else [],
                "mark": getattr(glyph, "mark", 0),
            }}
)PY", true},

    {"get_kerning", "",
     R"PY(        fg_font = getattr(font, "fgFont", None)
        pairs = []
        if fg_font is not None and hasattr(fg_font, "kerning"):
            kerning = fg_font.kerning
            if hasattr(kerning, "asDict"):
                for left, row in kerning.asDict().items():
                    for right, value in row.items():
                        pairs.append({"left": left, "right": right, "value": value})
        result = {"success": True, "data": {"pairs": pairs, "count": len(pairs)}}
)PY"},

    {"get_glyph_contours", "glyph_name = {{glyph_name}}\n",
     R"PY(            layer = glyph.layers[0] if glyph.layers else None
            contours = []
            shapes = layer.shapes if layer is not None else []
            for i, shape in enumerate(shapes):
                if getattr(shape, "isContour", False):
                    contours.append({
                        "index": i,
                        "closed": getattr(shape, "closed", True),
                        "nodes_count": len(shape.nodes) if hasattr(shape, "nodes") else 0,
                        "clockwise": getattr(shape, "clockwise", None),
                    })
            result = {"success": True, "data": {
                "name": glyph.name,
                "contours": contours,
                "count": len(contours),
            }}
)PY", true},

    {"get_glyph_paths", "glyph_name = {{glyph_name}}\n",
     R"PY(            layer = glyph.layers[0] if glyph.layers else None
            paths = []
            shapes = layer.shapes if layer is not None else []
            for shape in shapes:
                if not getattr(shape, "isContour", False):
                    continue
                nodes = []
                for node in getattr(shape, "nodes", []):
                    nodes.append({
                        "x": getattr(node, "x", 0),
                        "y": getattr(node, "y", 0),
                        "type": node.type.name if hasattr(node, "type") else "unknown",
                        "smooth": getattr(node, "smooth", False),
                    })
                paths.append({
                    "nodes": nodes,
                    "closed": getattr(shape, "closed", True),
                    "clockwise": getattr(shape, "clockwise", None),
                })
            result = {"success": True, "data": {
                "name": glyph.name,
                "paths": paths,
                "path_count": len(paths),
            }}
)PY", true},

    {"get_glyph_components", "glyph_name = {{glyph_name}}\n",
     R"PY(            layer = glyph.layers[0] if glyph.layers else None
            components = []
            shapes = layer.shapes if layer is not None else []
            for shape in shapes:
                if not getattr(shape, "isComponent", False):
                    continue
                t = getattr(shape, "transform", None)
                components.append({
                    "base_glyph": getattr(shape, "name", ""),
                    "transform": {
                        "xx": t.m11() if t is not None else 1.0,
                        "xy": t.m12() if t is not None else 0.0,
                        "yx": t.m21() if t is not None else 0.0,
                        "yy": t.m22() if t is not None else 1.0,
                        "dx": t.dx() if t is not None else 0.0,
                        "dy": t.dy() if t is not None else 0.0,
                    },
                })
            result = {"success": True, "data": {
                "name": glyph.name,
                "components": components,
                "count": len(components),
            }}
)PY", true},

    {"get_font_features", "",
     R"PY(        fg_font = getattr(font, "fgFont", None)
        text = ""
        if fg_font is not None and hasattr(fg_font, "features"):
            features = fg_font.features
            if hasattr(features, "asFea"):
                text = features.asFea()
            else:
                text = str(features)
        result = {"success": True, "data": {"features": text, "has_features": len(text) > 0}}
)PY"},

    {"get_glyph_classes", "",
     R"PY(        fg_font = getattr(font, "fgFont", None)
        classes = {}
        if fg_font is not None and hasattr(fg_font, "groups"):
            groups = fg_font.groups
            if hasattr(groups, "asDict"):
                classes = groups.asDict()
            elif hasattr(groups, "items"):
                classes = dict(groups.items())
        result = {"success": True, "data": {"classes": classes, "count": len(classes)}}
)PY"},

    {"create_glyph",
     "glyph_name = {{glyph_name}}\nunicode_value = {{unicode}}\nwidth = {{width}}\n",
     R"PY(        from fontlab import flGlyph
        if font.findGlyph(glyph_name) is not None:
            result = {"success": False, "error": f"Glyph already exists: {glyph_name}"}
        else:
            glyph = flGlyph()
            glyph.name = glyph_name
            glyph.width = width
            if unicode_value is not None:
                glyph.unicode = unicode_value
            font.addGlyph(glyph)
            result = {"success": True, "message": "Glyph created successfully", "data": {
                "name": glyph.name,
                "unicode": glyph.unicode if glyph.unicode else None,
                "width": glyph.width,
            }}
)PY"},

    {"modify_glyph_width", "glyph_name = {{glyph_name}}\nwidth = {{width}}\n",
     R"PY(            old_width = glyph.width
            glyph.width = width
            glyph.update()
            result = {"success": True, "message": "Glyph width updated", "data": {
                "name": glyph.name,
                "old_width": old_width,
                "new_width": glyph.width,
            }}
)PY", true},

    {"transform_glyph",
     "glyph_name = {{glyph_name}}\n"
     "scale_x = {{scale_x}}\nscale_y = {{scale_y}}\nrotate = {{rotate}}\n"
     "translate_x = {{translate_x}}\ntranslate_y = {{translate_y}}\n",
     R"PY(            from fontlab import flTransform
            transform = flTransform()
            if scale_x != 1.0 or scale_y != 1.0:
                transform.scale(scale_x, scale_y)
            if rotate != 0:
                transform.rotate(rotate)
            if translate_x != 0 or translate_y != 0:
                transform.translate(translate_x, translate_y)
            glyph.layers[0].applyTransform(transform)
            glyph.update()
            result = {"success": True, "message": "Transformation applied", "data": {
                "name": glyph.name,
                "transformations": {
                    "scale_x": scale_x,
                    "scale_y": scale_y,
                    "rotate": rotate,
                    "translate_x": translate_x,
                    "translate_y": translate_y,
                },
            }}
)PY", true},

    {"update_font_info", "updates = {{updates}}\n",
     R"PY(        info = font.info
        if "family_name" in updates:
            info.familyName = updates["family_name"]
        if "style_name" in updates:
            info.styleName = updates["style_name"]
        if "version" in updates:
            info.version = updates["version"]
        if "copyright" in updates:
            info.copyright = updates["copyright"]
        font.update()
        result = {"success": True, "message": "Font info updated", "data": {
            "family_name": info.familyName or "",
            "style_name": info.styleName or "",
            "version": getattr(info, "version", ""),
            "copyright": getattr(info, "copyright", ""),
        }}
)PY"},

    {"export_font", "export_path = {{path}}\nexport_format = {{format}}\n",
     R"PY(        if font.save(export_path, export_format):
            result = {"success": True, "message": "Font exported successfully", "data": {
                "path": export_path,
                "format": export_format,
            }}
        else:
            result = {"success": False, "error": "Export failed"}
)PY"},

    {"delete_glyph", "glyph_name = {{glyph_name}}\n",
     R"PY(            font.removeGlyph(glyph)
            font.update()
            result = {"success": True, "message": "Glyph deleted successfully", "data": {
                "name": glyph_name,
            }}
)PY", true},
};

struct Registry {
  std::vector<std::string> names;
  std::map<std::string, ScriptTemplate> by_name;

  Registry() {
    for (const Entry &e : kEntries) {
      names.emplace_back(e.name);
      by_name.emplace(e.name, ScriptTemplate(e.name, assemble(e.params, e.body, e.finds_glyph)));
    }
  }
};

const Registry &registry() {
  static const Registry r;
  return r;
}

} // namespace

const std::vector<std::string> &names() { return registry().names; }

const ScriptTemplate &get(const std::string &name) {
  const auto &m = registry().by_name;
  auto it = m.find(name);
  if (it == m.end())
    throw UnknownOperationError(name);
  return it->second;
}

} // namespace fontbridge::templates
