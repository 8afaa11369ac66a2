#include "fontbridge/host_locator.hpp"

#include <unistd.h>

#include <cctype>
#include <filesystem>

#include "fontbridge/log.hpp"
#include "fontbridge/types.hpp"

namespace fs = std::filesystem;

namespace fontbridge {

const std::vector<std::string> &default_host_candidates() {
  static const std::vector<std::string> v = {
      "/Applications/FontLab 8.app/Contents/MacOS/FontLab",
      "/Applications/FontLab 7.app/Contents/MacOS/FontLab",
      "/usr/local/bin/fontlab",
      "/opt/fontlab/bin/fontlab",
  };
  return v;
}

HostPath validate_host_path(const std::string &path) {
  if (path.empty()) {
    log_event(LogLevel::error, "security", "host_path_missing");
    throw HostNotFoundError(
        "FontLab executable not found. Pass --host, set FONTBRIDGE_HOST_PATH, "
        "or install FontLab in a standard location.");
  }

  std::error_code ec;
  const fs::path resolved = fs::canonical(fs::path(path), ec);
  if (ec || !fs::is_regular_file(resolved, ec)) {
    log_event(LogLevel::error, "security", "host_path_not_file",
              {{"path", jsonlite::Value{path}}});
    throw HostNotFoundError("FontLab executable not found: " + path);
  }
  if (::access(resolved.c_str(), X_OK) != 0) {
    log_event(LogLevel::error, "security", "host_path_not_executable",
              {{"path", jsonlite::Value{path}}});
    throw HostNotFoundError("FontLab executable is not executable: " + path);
  }

  std::string name = resolved.filename().string();
  for (auto &c : name)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  const bool plausible = name.rfind("fontlab", 0) == 0;
  if (!plausible)
    log_event(LogLevel::warn, "security", "host_name_suspicious",
              {{"name", jsonlite::Value{resolved.filename().string()}}});

  log_event(LogLevel::info, "security", "host_path_validated",
            {{"path", jsonlite::Value{resolved.string()}}});
  return HostPath(resolved.string(), plausible);
}

HostPath locate_host(const std::string &explicit_path,
                     const std::vector<std::string> &candidates) {
  if (!explicit_path.empty())
    return validate_host_path(explicit_path);
  std::error_code ec;
  for (const auto &c : candidates) {
    if (fs::exists(fs::path(c), ec))
      return validate_host_path(c);
  }
  return validate_host_path("");
}

} // namespace fontbridge
