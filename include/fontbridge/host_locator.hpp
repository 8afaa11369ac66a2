#pragma once

// fontbridge/host_locator.hpp — Resolution and validation of the host
// application executable.
//
// HostPath can only be produced by locate_host()/validate_host_path(), so an
// ExecutionBridge cannot be constructed around an unchecked path.

#include <string>
#include <vector>

namespace fontbridge {

class HostPath {
public:
  const std::string &str() const { return path_; }
  // False when the file name does not look like the expected host.
  bool name_plausible() const { return name_plausible_; }

private:
  HostPath(std::string path, bool plausible)
      : path_(std::move(path)), name_plausible_(plausible) {}
  std::string path_;
  bool name_plausible_{true};

  friend HostPath validate_host_path(const std::string &path);
};

// Conventional install locations, in search order.
const std::vector<std::string> &default_host_candidates();

// Checks that path exists, is a regular file (after following links) and is
// executable by the current user. Logs a security warning when the file name
// does not start with "fontlab" (case-insensitive). Throws HostNotFoundError.
HostPath validate_host_path(const std::string &path);

// explicit_path when non-empty, otherwise the first existing candidate.
// Throws HostNotFoundError when nothing usable is found.
HostPath locate_host(const std::string &explicit_path,
                     const std::vector<std::string> &candidates =
                         default_host_candidates());

} // namespace fontbridge
