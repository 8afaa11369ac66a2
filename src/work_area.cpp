#include "fontbridge/work_area.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

#include "fontbridge/log.hpp"

namespace fs = std::filesystem;

namespace fontbridge {

SecureWorkArea::SecureWorkArea(const std::string &root) {
  std::string base = root;
  if (base.empty()) {
    std::error_code ec;
    base = fs::temp_directory_path(ec).string();
    if (ec)
      base = "/tmp";
  }
  std::string templ = base + "/fontbridge_XXXXXX";
  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr)
    throw std::system_error(errno, std::generic_category(),
                            "mkdtemp failed under work root");
  dir_ = buf.data();
  if (::chmod(dir_.c_str(), S_IRWXU) != 0) {
    const int err = errno;
    remove();
    throw std::system_error(err, std::generic_category(), "chmod work area");
  }
}

SecureWorkArea::SecureWorkArea(SecureWorkArea &&other) noexcept
    : dir_(std::move(other.dir_)) {
  other.dir_.clear();
}

SecureWorkArea::~SecureWorkArea() { remove(); }

void SecureWorkArea::write_script(const std::string &body) const {
  const std::string path = script_path();
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                        S_IRUSR | S_IWUSR);
  if (fd < 0)
    throw std::system_error(errno, std::generic_category(), "create script file");
  std::size_t off = 0;
  while (off < body.size()) {
    const ssize_t n = ::write(fd, body.data() + off, body.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      const int err = errno;
      ::close(fd);
      throw std::system_error(err, std::generic_category(), "write script file");
    }
    off += static_cast<std::size_t>(n);
  }
  // umask can only narrow the mode; fchmod pins it to exactly 0600.
  if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
    const int err = errno;
    ::close(fd);
    throw std::system_error(err, std::generic_category(), "chmod script file");
  }
  if (::close(fd) != 0)
    throw std::system_error(errno, std::generic_category(), "close script file");
}

std::optional<std::string> SecureWorkArea::read_output(std::size_t max_bytes) const {
  const std::string path = output_path();
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return std::nullopt;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return std::nullopt;
  std::string data;
  char buf[8192];
  while (ifs && data.size() < max_bytes) {
    ifs.read(buf, sizeof(buf));
    data.append(buf, static_cast<std::size_t>(ifs.gcount()));
  }
  if (data.size() > max_bytes)
    data.resize(max_bytes);
  return data;
}

bool SecureWorkArea::remove() {
  if (dir_.empty())
    return true;
  std::error_code ec;
  fs::remove_all(dir_, ec);
  if (ec) {
    log_event(LogLevel::error, "bridge", "work_area_cleanup_failed",
              {{"error", jsonlite::Value{ec.message()}}});
    dir_.clear();
    return false;
  }
  dir_.clear();
  return true;
}

} // namespace fontbridge
