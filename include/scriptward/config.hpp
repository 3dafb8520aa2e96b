#pragma once

// scriptward/config.hpp - Engine configuration.
//
// EngineConfig is built once (from_env, optionally overlaid by a JSON file)
// and treated as immutable afterwards. Engine copies it at construction.
//
// ENVIRONMENT:
//   SCRIPTWARD_WORKSPACE_DIR, SCRIPTWARD_INTERPRETER, SCRIPTWARD_MAX_MEM_BYTES,
//   SCRIPTWARD_MAX_FSIZE_BYTES, SCRIPTWARD_MAX_OPEN_FILES,
//   SCRIPTWARD_OUTPUT_CAP_BYTES, SCRIPTWARD_FIXER_CMD,
//   SCRIPTWARD_FIXER_TIMEOUT_SECONDS, SCRIPTWARD_SANDBOX_DISABLED=1,
//   SCRIPTWARD_ARTIFACT_LOG.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace scriptward {

constexpr int kMinTimeoutSeconds = 1;
constexpr int kMaxTimeoutSeconds = 300;
constexpr int kMinAttempts = 1;
constexpr int kMaxAttempts = 3;
constexpr int kMinListLimit = 1;
constexpr int kMaxListLimit = 200;
constexpr int kMinMaxAgeHours = 1;
constexpr int kMaxMaxAgeHours = 720;

int clamp_timeout_seconds(int seconds);
int clamp_max_attempts(int attempts);
int clamp_list_limit(int limit);
int clamp_max_age_hours(int hours);

// Denylists and dangerous patterns for the Static Validator.
struct ValidationPolicy {
  std::vector<std::string> deny_modules;
  std::vector<std::string> deny_calls;
  std::vector<std::string> dangerous_patterns;  // ECMAScript regex, matched case-insensitively per line

  static ValidationPolicy defaults();
};

struct EngineConfig {
  std::string workspace_dir{".scriptward/workspaces"};
  std::string interpreter;
  std::vector<std::string> interpreter_args{"-I", "-B"};
  std::string source_extension{"py"};

  ValidationPolicy validation{ValidationPolicy::defaults()};

  std::vector<std::string> env_allowlist{"PATH", "HOME", "LANG", "LC_ALL", "TZ"};
  std::map<std::string, std::string> injected_env{{"PYTHONUNBUFFERED", "1"}, {"MPLBACKEND", "Agg"}};

  std::uint64_t max_memory_bytes{1500ULL * 1024 * 1024};
  std::uint64_t max_file_size_bytes{200ULL * 1024 * 1024};
  std::uint64_t max_open_files{256};
  std::size_t output_cap_bytes{200000};
  std::size_t preview_cap_bytes{50000};
  std::size_t error_raw_cap_bytes{20000};

  int default_timeout_seconds{30};
  // Resolver lookup budget per validated source.
  int resolver_timeout_seconds{15};

  // Helper command for the remote fixer. Empty = remote fixer unavailable.
  std::vector<std::string> fixer_command;
  int fixer_timeout_seconds{60};

  bool link_session_root{true};
  // Master switch for resource limits. SCRIPTWARD_SANDBOX_DISABLED=1 turns
  // rlimits off for debugging; process-group isolation and the timeout stay.
  bool sandbox_enabled{true};

  std::string artifact_log_path;

  static EngineConfig from_env();
};

// Locate a Python 3 interpreter: /usr/bin/python3, /usr/local/bin/python3,
// then PATH. Returns an empty string when none is executable.
std::string find_interpreter();

// Absolute path of an executable: names containing '/' are checked as given,
// bare names are looked up on PATH. Empty when not found.
std::string find_executable(const std::string& name);

// Overlay keys present in config_json onto config. Returns false (and sets
// *error) when the document fails validate_config().
bool apply_config_json(const std::string& config_json, EngineConfig& config, std::string* error);
bool load_config_file(const std::string& path, EngineConfig& config, std::string* error);

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const std::string& config_json);
std::string config_validation_to_json(const ConfigValidationResult& r);

}  // namespace scriptward
