#include "fontbridge/host_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include "fontbridge/log.hpp"

extern char **environ;

namespace fontbridge {

namespace {

using Clock = std::chrono::steady_clock;

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.rfind(prefix, 0) == 0;
}

void append_limited(std::string &dst, const char *src, ssize_t n,
                    std::size_t limit, bool &truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n))
    truncated = true;
}

class Pipe {
public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) {
      fds_[0] = fds_[1] = -1;
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  bool ok() const { return fds_[0] >= 0 && fds_[1] >= 0; }
  int read_fd() const { return fds_[0]; }
  int write_fd() const { return fds_[1]; }
  void close_read() {
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
      fds_[0] = -1;
    }
  }
  void close_write() {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

private:
  int fds_[2];
};

// Reads whatever is available on the capture pipes, waiting up to wait_ms for
// data. Closed streams are marked with fd < 0.
void pump(int &out_fd, int &err_fd, ProcessResult &result, std::size_t limit,
          int wait_ms) {
  pollfd pfds[2];
  nfds_t n = 0;
  if (out_fd >= 0)
    pfds[n++] = {out_fd, POLLIN, 0};
  if (err_fd >= 0)
    pfds[n++] = {err_fd, POLLIN, 0};
  if (n == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
    return;
  }
  if (::poll(pfds, n, wait_ms) <= 0)
    return;
  char buf[4096];
  for (nfds_t i = 0; i < n; ++i) {
    if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR)))
      continue;
    const bool is_out = pfds[i].fd == out_fd;
    const ssize_t r = ::read(pfds[i].fd, buf, sizeof(buf));
    if (r > 0) {
      if (is_out)
        append_limited(result.stdout_text, buf, r, limit, result.stdout_truncated);
      else
        append_limited(result.stderr_text, buf, r, limit, result.stderr_truncated);
    } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
      (is_out ? out_fd : err_fd) = -1;
    }
  }
}

void drain(int fd, std::string &dst, std::size_t limit, bool &truncated) {
  if (fd < 0)
    return;
  char buf[4096];
  while (true) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n <= 0)
      break;
    append_limited(dst, buf, n, limit, truncated);
  }
}

void record_status(ProcessResult &result, int status) {
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + result.term_signal;
  }
}

// Polls for the child to be reaped until the deadline, pumping output so the
// child never blocks on a full pipe.
bool wait_until(pid_t pid, Clock::time_point deadline, int &out_fd, int &err_fd,
                ProcessResult &result, std::size_t limit) {
  int status = 0;
  while (true) {
    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      record_status(result, status);
      return true;
    }
    if (w < 0 && errno == ECHILD)
      return true;
    const auto now = Clock::now();
    if (now >= deadline)
      return false;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                          deadline - now)
                          .count();
    pump(out_fd, err_fd, result, limit,
         static_cast<int>(std::clamp<long long>(left, 1, 10)));
  }
}

void signal_group(pid_t pid, int sig) {
  ::kill(-pid, sig);
  ::kill(pid, sig);
}

} // namespace

bool is_secret_key(const std::string &key) {
  auto ends_with = [&](const std::string &suffix) {
    return key.size() >= suffix.size() &&
           key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if (ends_with("_TOKEN") || ends_with("_SECRET") || ends_with("_KEY") ||
      ends_with("_PASSWORD") || ends_with("_CREDENTIAL") ||
      ends_with("_CREDENTIALS"))
    return true;
  if (starts_with(key, "AUTH") || starts_with(key, "COOKIE") ||
      starts_with(key, "AWS_SECRET") || starts_with(key, "AWS_SESSION") ||
      starts_with(key, "GH_TOKEN") || starts_with(key, "GITHUB_TOKEN") ||
      starts_with(key, "NPM_TOKEN"))
    return true;
  return false;
}

std::map<std::string, std::string> host_environment() {
  std::map<std::string, std::string> env;
  for (char **e = environ; e && *e; ++e) {
    const std::string kv = *e;
    const auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0)
      continue;
    std::string key = kv.substr(0, eq);
    if (is_secret_key(key))
      continue;
    env.emplace(std::move(key), kv.substr(eq + 1));
  }
  return env;
}

ProcessResult run_host_process(const ProcessSpec &spec) {
  ProcessResult result;
  const auto started = Clock::now();

  Pipe out_pipe;
  Pipe err_pipe;
  Pipe exec_pipe;  // child reports execve errno here; EOF means exec succeeded
  if (!out_pipe.ok() || !err_pipe.ok() || !exec_pipe.ok()) {
    result.spawn_error = std::strerror(errno);
    return result;
  }

  // Everything the child needs is built before fork().
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char *> argv;
  argv.reserve(all.size() + 1);
  for (auto &s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  envs.reserve(spec.env.size());
  for (const auto &[k, v] : spec.env)
    envs.push_back(k + "=" + v);
  std::vector<char *> envp;
  envp.reserve(envs.size() + 1);
  for (auto &e : envs)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.spawn_error = std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    ::setsid();
    ::dup2(out_pipe.write_fd(), STDOUT_FILENO);
    ::dup2(err_pipe.write_fd(), STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    int err = 0;
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
      err = errno;
    } else {
      ::execve(spec.command.c_str(), argv.data(), envp.data());
      err = errno;
    }
    ssize_t ignored = ::write(exec_pipe.write_fd(), &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  result.pid = pid;
  out_pipe.close_write();
  err_pipe.close_write();
  exec_pipe.close_write();

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe.read_fd(), &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    result.spawn_error = std::strerror(child_errno);
    result.final_state = ProcessState::exited;
    result.run_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started)
            .count());
    return result;
  }

  result.spawned = true;
  result.final_state = ProcessState::running;
  ::fcntl(out_pipe.read_fd(), F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe.read_fd(), F_SETFL, O_NONBLOCK);
  int out_fd = out_pipe.read_fd();
  int err_fd = err_pipe.read_fd();
  const std::size_t limit = spec.max_capture_bytes;

  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  if (wait_until(pid, deadline, out_fd, err_fd, result, limit)) {
    result.final_state = ProcessState::exited;
  } else {
    result.timed_out = true;
    log_event(LogLevel::warn, "security", "host_timeout",
              {{"pid", pid}, {"timeout_ms", spec.timeout_ms}});

    result.final_state = ProcessState::terminating_graceful;
    signal_group(pid, SIGTERM);
    if (wait_until(pid, Clock::now() + std::chrono::milliseconds(spec.grace_period_ms),
                   out_fd, err_fd, result, limit)) {
      result.final_state = ProcessState::exited;
    } else {
      result.final_state = ProcessState::terminating_forced;
      log_event(LogLevel::warn, "bridge", "host_sigkill", {{"pid", pid}});
      signal_group(pid, SIGKILL);
      if (wait_until(pid, Clock::now() + std::chrono::milliseconds(spec.kill_wait_ms),
                     out_fd, err_fd, result, limit)) {
        result.final_state = ProcessState::killed;
      } else {
        signal_group(pid, SIGKILL);
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid) {
          record_status(result, status);
          result.final_state = ProcessState::killed;
        } else {
          result.final_state = ProcessState::leaked;
          log_event(LogLevel::error, "bridge", "host_process_leaked",
                    {{"pid", pid}});
        }
      }
    }
  }

  drain(out_fd, result.stdout_text, limit, result.stdout_truncated);
  drain(err_fd, result.stderr_text, limit, result.stderr_truncated);

  result.run_ns = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started)
          .count());
  return result;
}

} // namespace fontbridge
