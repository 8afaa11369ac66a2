#pragma once

// fontbridge/work_area.hpp — Private per-call scratch directory.
//
// Layout:
//   <root>/fontbridge_XXXXXX/        mode 0700, unique (mkdtemp)
//     script.py                      mode 0600, written once
//     output.json                    written by the host, if at all
//
// The directory is removed recursively when the SecureWorkArea is destroyed.
// Removal errors are logged on the "bridge" channel and never thrown.

#include <optional>
#include <string>

namespace fontbridge {

class SecureWorkArea {
public:
  // Creates the directory under root (system temp dir when empty). Throws
  // std::system_error on failure.
  explicit SecureWorkArea(const std::string &root = "");
  ~SecureWorkArea();

  SecureWorkArea(SecureWorkArea &&other) noexcept;
  SecureWorkArea &operator=(SecureWorkArea &&) = delete;
  SecureWorkArea(const SecureWorkArea &) = delete;
  SecureWorkArea &operator=(const SecureWorkArea &) = delete;

  const std::string &dir() const { return dir_; }
  std::string script_path() const { return dir_ + "/script.py"; }
  std::string output_path() const { return dir_ + "/output.json"; }

  // Writes the script with mode 0600. Throws std::system_error.
  void write_script(const std::string &body) const;

  // Contents of the output file, or nullopt when the host did not create it.
  std::optional<std::string> read_output(std::size_t max_bytes) const;

  // Removes the directory now. Idempotent. Returns false (after logging) when
  // removal failed.
  bool remove();

private:
  std::string dir_;
};

} // namespace fontbridge
