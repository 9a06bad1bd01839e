#include "taskweave/process/subprocess.hpp"

#include "taskweave/util/log.hpp"

#include <sys/socket.h>
#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <thread>
#include <unordered_set>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace taskweave {

namespace {

inline constexpr std::size_t READ_BUFFER_SIZE = 4096;
inline constexpr std::size_t INITIAL_OUTPUT_RESERVE = 8192;

class UniqueFd {
public:
  UniqueFd() noexcept = default;
  explicit UniqueFd(int fd) noexcept : fd_(fd) {}

  UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  auto operator=(UniqueFd&& other) noexcept -> UniqueFd& {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  UniqueFd(const UniqueFd&) = delete;
  auto operator=(const UniqueFd&) -> UniqueFd& = delete;

  ~UniqueFd() { reset(); }

  [[nodiscard]] auto get() const noexcept -> int { return fd_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

  auto reset() noexcept -> void {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_{-1};
};

auto create_pipe(UniqueFd& read_end, UniqueFd& write_end) -> bool {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return false;
  }
  read_end = UniqueFd{fds[0]};
  write_end = UniqueFd{fds[1]};
  return true;
}

// stdin goes through a socket pair so writes can use MSG_NOSIGNAL: a child
// that exits without reading its input must not raise SIGPIPE in this process.
auto create_stdin_channel(UniqueFd& parent_end, UniqueFd& child_end) -> bool {
  int fds[2];
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
    return false;
  }
  parent_end = UniqueFd{fds[0]};
  child_end = UniqueFd{fds[1]};
  shutdown(fds[0], SHUT_RD);
  shutdown(fds[1], SHUT_WR);
  return true;
}

auto set_nonblocking(int fd) -> void {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

auto build_environment(
    const std::vector<std::pair<std::string, std::string>>& overrides)
    -> std::vector<std::string> {
  std::unordered_set<std::string_view> overridden;
  for (const auto& [key, value] : overrides) {
    overridden.insert(key);
  }

  std::vector<std::string> env;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    std::string_view kv{*entry};
    auto eq = kv.find('=');
    if (eq != std::string_view::npos && overridden.contains(kv.substr(0, eq))) {
      continue;
    }
    env.emplace_back(kv);
  }
  for (const auto& [key, value] : overrides) {
    env.push_back(key + "=" + value);
  }
  return env;
}

auto to_cstrings(std::vector<std::string>& strings) -> std::vector<char*> {
  std::vector<char*> out;
  out.reserve(strings.size() + 1);
  for (auto& s : strings) {
    out.push_back(s.data());
  }
  out.push_back(nullptr);
  return out;
}

constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(10);

// Appends at most `limit - out.size()` bytes; zero limit means unbounded.
// Returns false when bytes were dropped.
auto append_bounded(std::string& out, const char* data, std::size_t n,
                    std::size_t limit) -> bool {
  if (limit == 0) {
    out.append(data, n);
    return true;
  }
  auto room = out.size() < limit ? limit - out.size() : 0;
  out.append(data, std::min(n, room));
  return n <= room;
}

auto wait_blocking(pid_t pid, int& status) -> pid_t {
  pid_t waited;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  return waited;
}

}  // namespace

auto exit_code_from_status(int status) noexcept -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto run_process(const std::vector<std::string>& argv,
                 const ProcessOptions& options) -> Result<ProcessResult> {
  if (argv.empty() || argv.front().empty()) {
    return fail(Error::InvalidArgument);
  }

  UniqueFd out_read, out_write, err_read, err_write, exec_read, exec_write;
  UniqueFd in_parent, in_child;
  if (!create_pipe(out_read, out_write) || !create_pipe(err_read, err_write) ||
      !create_pipe(exec_read, exec_write) ||
      !create_stdin_channel(in_parent, in_child)) {
    log::error("Failed to create pipes for {}: {}", argv.front(),
               std::strerror(errno));
    return fail(Error::SpawnFailed);
  }

  // Everything the child touches is prepared before fork.
  auto args = argv;
  auto c_args = to_cstrings(args);
  auto env = build_environment(options.env);
  auto c_env = to_cstrings(env);
  const char* cwd =
      options.working_dir.empty() ? nullptr : options.working_dir.c_str();

  pid_t pid = fork();
  if (pid < 0) {
    log::error("fork failed for {}: {}", argv.front(), std::strerror(errno));
    return fail(Error::SpawnFailed);
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    setpgid(0, 0);
    dup2(in_child.get(), STDIN_FILENO);
    dup2(out_write.get(), STDOUT_FILENO);
    dup2(err_write.get(), STDERR_FILENO);

    if (cwd != nullptr && chdir(cwd) < 0) {
      int err = errno;
      (void)!write(exec_write.get(), &err, sizeof(err));
      _exit(127);
    }

    execvpe(c_args[0], c_args.data(), c_env.data());
    int err = errno;
    (void)!write(exec_write.get(), &err, sizeof(err));
    _exit(127);
  }

  setpgid(pid, pid);
  in_child.reset();
  out_write.reset();
  err_write.reset();
  exec_write.reset();

  // exec_read sees EOF on a successful exec (O_CLOEXEC), or the child's errno.
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(exec_read.get(), &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  exec_read.reset();

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    waitpid(pid, &status, 0);
    log::error("Failed to start {}: {}", argv.front(),
               std::strerror(child_errno));
    return fail(Error::SpawnFailed);
  }

  if (options.on_spawn) {
    options.on_spawn(pid);
  }

  set_nonblocking(out_read.get());
  set_nonblocking(err_read.get());
  set_nonblocking(in_parent.get());

  ProcessResult result;
  result.stdout_output.reserve(INITIAL_OUTPUT_RESERVE);

  std::size_t stdin_offset = 0;
  if (options.stdin_data.empty()) {
    in_parent.reset();
  }

  auto start = std::chrono::steady_clock::now();
  std::array<char, READ_BUFFER_SIZE> buffer;

  while (out_read.valid() || err_read.valid()) {
    int timeout_ms = -1;
    if (options.timeout.count() > 0) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start);
      auto remaining = options.timeout - elapsed;
      if (remaining.count() <= 0) {
        result.timed_out = true;
        break;
      }
      timeout_ms = static_cast<int>(remaining.count());
    }

    std::array<pollfd, 3> pfds{};
    nfds_t count = 0;
    int out_idx = -1, err_idx = -1, in_idx = -1;
    if (out_read.valid()) {
      out_idx = static_cast<int>(count);
      pfds[count++] = {out_read.get(), POLLIN, 0};
    }
    if (err_read.valid()) {
      err_idx = static_cast<int>(count);
      pfds[count++] = {err_read.get(), POLLIN, 0};
    }
    if (in_parent.valid()) {
      in_idx = static_cast<int>(count);
      pfds[count++] = {in_parent.get(), POLLOUT, 0};
    }

    int ret = ::poll(pfds.data(), count, timeout_ms);
    if (ret < 0) {
      if (errno == EINTR)
        continue;
      log::error("poll failed while running {}: {}", argv.front(),
                 std::strerror(errno));
      break;
    }
    if (ret == 0) {
      result.timed_out = true;
      break;
    }

    auto drain = [&](UniqueFd& fd, const pollfd& p, std::string& sink) {
      if ((p.revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        return;
      }
      ssize_t got = read(fd.get(), buffer.data(), buffer.size());
      if (got > 0) {
        if (!append_bounded(sink, buffer.data(), static_cast<std::size_t>(got),
                            options.max_output)) {
          result.truncated = true;
        }
      } else if (got == 0 || (errno != EAGAIN && errno != EINTR)) {
        fd.reset();
      }
    };

    if (out_idx >= 0)
      drain(out_read, pfds[out_idx], result.stdout_output);
    if (err_idx >= 0)
      drain(err_read, pfds[err_idx], result.stderr_output);

    if (in_idx >= 0 && pfds[in_idx].revents != 0) {
      if ((pfds[in_idx].revents & POLLOUT) != 0) {
        const auto& data = options.stdin_data;
        ssize_t sent = send(in_parent.get(), data.data() + stdin_offset,
                            data.size() - stdin_offset, MSG_NOSIGNAL);
        if (sent > 0) {
          stdin_offset += static_cast<std::size_t>(sent);
        } else if (sent < 0 && errno != EAGAIN && errno != EINTR) {
          in_parent.reset();
        }
      } else {
        in_parent.reset();
      }
      if (in_parent.valid() && stdin_offset >= options.stdin_data.size()) {
        in_parent.reset();
      }
    }
  }

  in_parent.reset();

  if (result.truncated) {
    log::warn("Output of {} exceeded {} bytes and was truncated", argv.front(),
              options.max_output);
  }

  int status = 0;
  pid_t waited = 0;

  // The child may close its output and keep running; the timeout still
  // applies to reaping it.
  if (!result.timed_out && options.timeout.count() > 0) {
    while (true) {
      waited = waitpid(pid, &status, WNOHANG);
      if (waited != 0 && !(waited < 0 && errno == EINTR)) {
        break;
      }
      if (std::chrono::steady_clock::now() - start >= options.timeout) {
        result.timed_out = true;
        waited = 0;
        break;
      }
      std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }
  }

  if (result.timed_out) {
    log::warn("{} timed out after {}ms, killing process group {}",
              argv.front(), options.timeout.count(), pid);
    kill(-pid, SIGKILL);
  }

  if (waited == 0) {
    waited = wait_blocking(pid, status);
  }

  if (waited < 0) {
    log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
    result.exit_code = -1;
  } else {
    result.exit_code = exit_code_from_status(status);
  }

  return result;
}

}  // namespace taskweave
