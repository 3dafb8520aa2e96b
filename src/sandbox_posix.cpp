#ifndef _WIN32

#include "scriptward/sandbox.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>

namespace scriptward {

namespace {

constexpr int kPolicyFailedStatus = 126;
constexpr int kExecFailedStatus = 127;
constexpr int kTimeoutExitCode = 124;
constexpr int kMaxFdSweep = 65536;

void append_limited(std::string& dst, const char* src, ssize_t n,
                    std::size_t limit, bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) truncated = true;
}

// Reads whatever is available without blocking. Returns false at EOF.
bool drain(int fd, std::string& dst, std::size_t limit, bool& truncated) {
  char buf[4096];
  while (true) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_limited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void close_pair(int fds[2]) {
  if (fds[0] >= 0) ::close(fds[0]);
  if (fds[1] >= 0) ::close(fds[1]);
  fds[0] = fds[1] = -1;
}

bool set_rlimit(int resource, std::uint64_t value) {
  struct rlimit rl;
  rl.rlim_cur = static_cast<rlim_t>(value);
  rl.rlim_max = static_cast<rlim_t>(value);
  return ::setrlimit(resource, &rl) == 0;
}

// Child side of the exec-status pipe: report errno to the parent and exit.
[[noreturn]] void child_fail(int status_fd, int status) {
  const int err = errno;
  ssize_t ignored = ::write(status_fd, &err, sizeof(err));
  (void)ignored;
  ::_exit(status);
}

}  // namespace

bool RlimitPolicy::apply_in_child() const noexcept {
  if (limits_.cpu_seconds > 0 && !set_rlimit(RLIMIT_CPU, limits_.cpu_seconds)) return false;
  if (limits_.address_space_bytes > 0) set_rlimit(RLIMIT_AS, limits_.address_space_bytes);
  if (limits_.file_size_bytes > 0) set_rlimit(RLIMIT_FSIZE, limits_.file_size_bytes);
  if (limits_.open_files > 0) set_rlimit(RLIMIT_NOFILE, limits_.open_files);
  return true;
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;

  // Everything the child needs is built here, before fork().
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  envs.reserve(spec.env.size());
  for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  int fd_limit = kMaxFdSweep;
  struct rlimit nofile;
  if (::getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY) {
    fd_limit = static_cast<int>(std::min<rlim_t>(nofile.rlim_cur, kMaxFdSweep));
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(status_pipe, O_CLOEXEC) != 0) {
    result.error_message = std::string("spawn_failed: pipe: ") + std::strerror(errno);
    close_pair(out_pipe);
    close_pair(err_pipe);
    close_pair(status_pipe);
    return result;
  }

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = ::fork();
  if (pid < 0) {
    result.error_message = std::string("spawn_failed: fork: ") + std::strerror(errno);
    close_pair(out_pipe);
    close_pair(err_pipe);
    close_pair(status_pipe);
    return result;
  }

  if (pid == 0) {
    ::setsid();
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    for (int fd = STDERR_FILENO + 1; fd < fd_limit; ++fd) {
      if (fd != status_pipe[1]) ::close(fd);
    }
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
      child_fail(status_pipe[1], kExecFailedStatus);
    }
    if (spec.policy && !spec.policy->apply_in_child()) {
      child_fail(status_pipe[1], kPolicyFailedStatus);
    }
    ::execve(spec.command.c_str(), argv.data(), envp.data());
    child_fail(status_pipe[1], kExecFailedStatus);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  ::close(status_pipe[1]);
  ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  int status = 0;
  bool out_open = true;
  bool err_open = true;
  while (true) {
    struct pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
    if (err_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};
    if (nfds > 0) ::poll(fds, nfds, 5);

    if (out_open) out_open = drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
    if (err_open) err_open = drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);

    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) break;
    if (std::chrono::steady_clock::now() >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    if (nfds == 0) {
      struct timespec ts{0, 2 * 1000 * 1000};
      ::nanosleep(&ts, nullptr);
    }
  }
  const auto finished = std::chrono::steady_clock::now();

  // Descendants that outlived the leader still hold the group id.
  ::kill(-pid, SIGKILL);

  if (out_open) drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
  if (err_open) drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);
  ::close(out_pipe[0]);
  ::close(err_pipe[0]);

  int child_errno = 0;
  const ssize_t status_bytes = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  ::close(status_pipe[0]);

  result.duration_ns = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(finished - started).count());

  if (status_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
    const bool policy_failed = WIFEXITED(status) && WEXITSTATUS(status) == kPolicyFailedStatus;
    result.error_message = std::string(policy_failed ? "spawn_failed: sandbox policy: "
                                                     : "spawn_failed: exec: ") +
                           std::strerror(child_errno);
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : kExecFailedStatus;
    return result;
  }

  result.spawned = true;
  if (result.timed_out) {
    result.exit_code = kTimeoutExitCode;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

std::vector<std::string> SandboxCapabilities::enforced() const {
  std::vector<std::string> out;
  if (process_group_isolation) out.push_back("process_group_isolation");
  if (rlimits_cpu) out.push_back("rlimits_cpu");
  if (rlimits_mem) out.push_back("rlimits_mem");
  if (rlimits_fsize) out.push_back("rlimits_fsize");
  if (rlimits_fds) out.push_back("rlimits_fds");
  if (seccomp) out.push_back("seccomp");
  if (network_isolation) out.push_back("network_isolation");
  return out;
}

std::vector<std::string> SandboxCapabilities::unsupported() const {
  std::vector<std::string> out;
  if (!process_group_isolation) out.push_back("process_group_isolation");
  if (!rlimits_cpu) out.push_back("rlimits_cpu");
  if (!rlimits_mem) out.push_back("rlimits_mem");
  if (!rlimits_fsize) out.push_back("rlimits_fsize");
  if (!rlimits_fds) out.push_back("rlimits_fds");
  if (!seccomp) out.push_back("seccomp");
  if (!network_isolation) out.push_back("network_isolation");
  return out;
}

SandboxCapabilities detect_platform_sandbox_capabilities() {
  SandboxCapabilities caps;
  caps.process_group_isolation = true;
  caps.rlimits_cpu = true;
  caps.rlimits_mem = true;
  caps.rlimits_fsize = true;
  caps.rlimits_fds = true;
  caps.seccomp = false;            // not implemented
  caps.network_isolation = false;  // not implemented
  return caps;
}

}  // namespace scriptward

#endif
