#pragma once

// fontbridge/script_template.hpp — Fixed script text with typed placeholders.
//
// Template text contains {{name}} placeholders (name: [a-z_][a-z0-9_]*).
// render() substitutes ScriptLiteral values only; there is no overload that
// takes a plain string. Every placeholder must be bound and every binding must
// be used; a mismatch is a programmer error and throws TemplateError.

#include <map>
#include <set>
#include <string>

#include "fontbridge/validation.hpp"

namespace fontbridge {

using Bindings = std::map<std::string, ScriptLiteral>;

class ScriptTemplate {
public:
  // Throws TemplateError on an unterminated or malformed placeholder.
  ScriptTemplate(std::string name, std::string text);

  const std::string &name() const { return name_; }
  const std::set<std::string> &placeholders() const { return placeholders_; }

  std::string render(const Bindings &bindings) const;

private:
  std::string name_;
  std::string text_;
  std::set<std::string> placeholders_;
};

} // namespace fontbridge
