#include "fontbridge/script_template.hpp"

#include "fontbridge/types.hpp"

namespace fontbridge {

namespace {

bool valid_placeholder(const std::string &name) {
  if (name.empty())
    return false;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    const bool ok = (c >= 'a' && c <= 'z') || c == '_' || (i > 0 && c >= '0' && c <= '9');
    if (!ok)
      return false;
  }
  return true;
}

} // namespace

ScriptTemplate::ScriptTemplate(std::string name, std::string text)
    : name_(std::move(name)), text_(std::move(text)) {
  std::size_t pos = 0;
  while ((pos = text_.find("{{", pos)) != std::string::npos) {
    const std::size_t close = text_.find("}}", pos + 2);
    if (close == std::string::npos)
      throw TemplateError(name_ + ": unterminated placeholder");
    const std::string key = text_.substr(pos + 2, close - pos - 2);
    if (!valid_placeholder(key))
      throw TemplateError(name_ + ": malformed placeholder '" + key + "'");
    placeholders_.insert(key);
    pos = close + 2;
  }
}

std::string ScriptTemplate::render(const Bindings &bindings) const {
  for (const auto &p : placeholders_)
    if (!bindings.contains(p))
      throw TemplateError(name_ + ": placeholder '" + p + "' is not bound");
  for (const auto &[k, v] : bindings)
    if (!placeholders_.contains(k))
      throw TemplateError(name_ + ": binding '" + k + "' is not used");

  std::string out;
  out.reserve(text_.size() + 64);
  std::size_t pos = 0;
  while (true) {
    const std::size_t open = text_.find("{{", pos);
    if (open == std::string::npos) {
      out.append(text_, pos, std::string::npos);
      break;
    }
    const std::size_t close = text_.find("}}", open + 2);
    out.append(text_, pos, open - pos);
    out += bindings.at(text_.substr(open + 2, close - open - 2)).text();
    pos = close + 2;
  }
  return out;
}

} // namespace fontbridge
