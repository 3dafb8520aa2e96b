#pragma once

// scriptward/sandbox.hpp - Process sandbox for guest execution.
//
// ISOLATION MODEL:
//   - Each child runs in its own session and process group (setsid). On
//     timeout, and after a natural exit, the whole group receives SIGKILL so no
//     descendant outlives its attempt.
//   - Resource limits are applied by a SandboxPolicy in the child, after
//     chdir() and before execve().
//   - argv and envp are fully materialized before fork(); the child performs
//     only async-signal-safe calls.
//   - stdin is /dev/null. Inherited descriptors above stderr are closed.
//
// NOT PROVIDED: network isolation, seccomp filtering, kernel-level
// confinement. detect_platform_sandbox_capabilities() reports these as
// unsupported rather than pretending.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace scriptward {

// 0 = leave the inherited limit unchanged.
struct ResourceLimits {
  std::uint64_t cpu_seconds{0};
  std::uint64_t address_space_bytes{0};
  std::uint64_t file_size_bytes{0};
  std::uint64_t open_files{0};
};

// EXTENSION_POINT: sandbox_policy
//   Current: RlimitPolicy (setrlimit only).
//   Upgrade path: a policy that installs a seccomp-bpf filter or Landlock
//   ruleset. Invariant: apply_in_child() runs between fork() and execve(),
//   so it must not allocate, lock, or touch stdio.
class SandboxPolicy {
 public:
  virtual ~SandboxPolicy() = default;

  // Returns false when a mandatory restriction could not be installed; the
  // child then exits with status 126 instead of running the guest.
  virtual bool apply_in_child() const noexcept = 0;
  virtual std::string name() const = 0;
};

class RlimitPolicy final : public SandboxPolicy {
 public:
  explicit RlimitPolicy(ResourceLimits limits) : limits_(limits) {}

  // RLIMIT_CPU is mandatory. Address space, file size and descriptor limits
  // are best-effort: a kernel refusing one of them does not block the run.
  bool apply_in_child() const noexcept override;
  std::string name() const override { return "rlimits"; }

  const ResourceLimits& limits() const { return limits_; }

 private:
  ResourceLimits limits_;
};

struct ProcessSpec {
  std::string command;  // absolute path, passed to execve()
  std::vector<std::string> argv;  // arguments after argv[0]
  std::map<std::string, std::string> env;  // complete child environment
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{4096};  // per stream
  const SandboxPolicy* policy{nullptr};  // not owned; nullptr = no limits
};

struct ProcessResult {
  bool spawned{false};
  int exit_code{0};  // 124 on timeout, 128+N when killed by signal N
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // set only when spawned == false
  std::uint64_t duration_ns{0};
};

// Never throws. Spawn failures (pipe, fork or execve errors) come back with
// spawned == false and error_message set.
ProcessResult run_process(const ProcessSpec& spec);

struct SandboxCapabilities {
  bool process_group_isolation{false};
  bool rlimits_cpu{false};
  bool rlimits_mem{false};
  bool rlimits_fsize{false};
  bool rlimits_fds{false};
  bool seccomp{false};
  bool network_isolation{false};

  std::vector<std::string> enforced() const;
  std::vector<std::string> unsupported() const;
};

SandboxCapabilities detect_platform_sandbox_capabilities();

}  // namespace scriptward
