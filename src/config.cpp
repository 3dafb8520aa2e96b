#include "scriptward/config.hpp"

#include <unistd.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

#include "scriptward/jsonlite.hpp"

namespace scriptward {

int clamp_timeout_seconds(int seconds) {
  return std::clamp(seconds, kMinTimeoutSeconds, kMaxTimeoutSeconds);
}
int clamp_max_attempts(int attempts) {
  return std::clamp(attempts, kMinAttempts, kMaxAttempts);
}
int clamp_list_limit(int limit) {
  return std::clamp(limit, kMinListLimit, kMaxListLimit);
}
int clamp_max_age_hours(int hours) {
  return std::clamp(hours, kMinMaxAgeHours, kMaxMaxAgeHours);
}

ValidationPolicy ValidationPolicy::defaults() {
  ValidationPolicy p;
  p.deny_modules = {"asyncio", "ctypes", "httpx", "importlib", "inspect",
                    "multiprocessing", "os", "pickle", "pty", "resource",
                    "shlex", "shutil", "signal", "socket", "subprocess",
                    "sys", "tempfile", "threading", "urllib"};
  p.deny_calls = {"eval", "exec", "compile", "__import__", "open_code"};
  p.dangerous_patterns = {R"(\bos\.system\s*\()", R"(\bos\.popen\s*\()",
                          R"(\bsubprocess\.)", R"(\bsocket\.)",
                          R"(\burllib\.)", R"(\bhttpx\.)", R"(\brequests\.)",
                          R"(rm\s+-rf)"};
  return p;
}

namespace {

const char* env_or_null(const char* name) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? e : nullptr;
}

bool parse_u64(const char* text, std::uint64_t& out) {
  const char* end = text + std::char_traits<char>::length(text);
  std::uint64_t v = 0;
  auto [p, ec] = std::from_chars(text, end, v);
  if (ec != std::errc() || p != end) return false;
  out = v;
  return true;
}

std::vector<std::string> split_ws(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream iss(s);
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

bool is_executable(const std::string& path) {
  return !path.empty() && ::access(path.c_str(), X_OK) == 0;
}

// Keys accepted in a config document, grouped by expected JSON type.
const std::vector<std::string> kStringKeys = {
    "config_version", "workspace_dir", "interpreter", "source_extension", "artifact_log_path"};
const std::vector<std::string> kStringArrayKeys = {
    "interpreter_args", "deny_modules", "deny_calls", "dangerous_patterns",
    "env_allowlist", "fixer_command"};
const std::vector<std::string> kStringMapKeys = {"injected_env"};
const std::vector<std::string> kUintKeys = {
    "max_memory_bytes", "max_file_size_bytes", "max_open_files",
    "output_cap_bytes", "preview_cap_bytes", "default_timeout_seconds",
    "resolver_timeout_seconds", "fixer_timeout_seconds"};
const std::vector<std::string> kBoolKeys = {"link_session_root", "sandbox_enabled"};

bool key_in(const std::string& key, const std::vector<std::string>& list) {
  return std::find(list.begin(), list.end(), key) != list.end();
}

bool all_strings(const jsonlite::Array& a) {
  for (const auto& item : a) {
    if (!std::holds_alternative<std::string>(item.v)) return false;
  }
  return true;
}

bool all_string_values(const jsonlite::Object& o) {
  for (const auto& [k, v] : o) {
    if (!std::holds_alternative<std::string>(v.v)) return false;
  }
  return true;
}

int saturate_int(unsigned long long v) {
  return v > static_cast<unsigned long long>(std::numeric_limits<int>::max())
             ? std::numeric_limits<int>::max()
             : static_cast<int>(v);
}

}  // namespace

std::string find_executable(const std::string& name) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) return is_executable(name) ? name : std::string();
  const char* path = env_or_null("PATH");
  if (!path) return {};
  std::string dirs(path);
  size_t start = 0;
  while (start <= dirs.size()) {
    size_t end = dirs.find(':', start);
    if (end == std::string::npos) end = dirs.size();
    const std::string dir = dirs.substr(start, end - start);
    if (!dir.empty()) {
      const std::string candidate = dir + "/" + name;
      if (is_executable(candidate)) return candidate;
    }
    start = end + 1;
  }
  return {};
}

std::string find_interpreter() {
  for (const char* candidate : {"/usr/bin/python3", "/usr/local/bin/python3"}) {
    if (is_executable(candidate)) return candidate;
  }
  return find_executable("python3");
}

EngineConfig EngineConfig::from_env() {
  EngineConfig c;
  if (const char* e = env_or_null("SCRIPTWARD_WORKSPACE_DIR")) c.workspace_dir = e;
  if (const char* e = env_or_null("SCRIPTWARD_INTERPRETER")) {
    c.interpreter = e;
  } else {
    c.interpreter = find_interpreter();
  }
  std::uint64_t v = 0;
  if (const char* e = env_or_null("SCRIPTWARD_MAX_MEM_BYTES"); e && parse_u64(e, v)) c.max_memory_bytes = v;
  if (const char* e = env_or_null("SCRIPTWARD_MAX_FSIZE_BYTES"); e && parse_u64(e, v)) c.max_file_size_bytes = v;
  if (const char* e = env_or_null("SCRIPTWARD_MAX_OPEN_FILES"); e && parse_u64(e, v)) c.max_open_files = v;
  if (const char* e = env_or_null("SCRIPTWARD_OUTPUT_CAP_BYTES"); e && parse_u64(e, v) && v > 0) {
    c.output_cap_bytes = static_cast<std::size_t>(v);
  }
  if (const char* e = env_or_null("SCRIPTWARD_FIXER_CMD")) c.fixer_command = split_ws(e);
  if (const char* e = env_or_null("SCRIPTWARD_FIXER_TIMEOUT_SECONDS"); e && parse_u64(e, v) && v > 0) {
    c.fixer_timeout_seconds = saturate_int(v);
  }
  if (const char* e = env_or_null("SCRIPTWARD_SANDBOX_DISABLED"); e && std::string(e) == "1") {
    c.sandbox_enabled = false;
  }
  if (const char* e = env_or_null("SCRIPTWARD_ARTIFACT_LOG")) c.artifact_log_path = e;
  return c;
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  r.config_version = jsonlite::get_string(obj, "config_version");
  if (obj.find("config_version") == obj.end()) {
    r.warnings.push_back("config_version missing, assuming \"1\"");
  } else if (r.config_version != "1") {
    r.errors.push_back("unsupported config_version: " + r.config_version);
  }

  for (const auto& [key, value] : obj) {
    if (key_in(key, kStringKeys)) {
      if (!std::holds_alternative<std::string>(value.v)) r.errors.push_back(key + ": expected string");
    } else if (key_in(key, kStringArrayKeys)) {
      if (!std::holds_alternative<jsonlite::Array>(value.v) ||
          !all_strings(std::get<jsonlite::Array>(value.v))) {
        r.errors.push_back(key + ": expected array of strings");
      }
    } else if (key_in(key, kStringMapKeys)) {
      if (!std::holds_alternative<jsonlite::Object>(value.v) ||
          !all_string_values(std::get<jsonlite::Object>(value.v))) {
        r.errors.push_back(key + ": expected object of strings");
      }
    } else if (key_in(key, kUintKeys)) {
      if (!std::holds_alternative<std::uint64_t>(value.v)) r.errors.push_back(key + ": expected non-negative integer");
    } else if (key_in(key, kBoolKeys)) {
      if (!std::holds_alternative<bool>(value.v)) r.errors.push_back(key + ": expected boolean");
    } else {
      r.warnings.push_back("unknown key: " + key);
    }
  }

  for (const auto& pattern : jsonlite::get_string_array(obj, "dangerous_patterns")) {
    try {
      std::regex re(pattern, std::regex::ECMAScript | std::regex::icase);
      (void)re;
    } catch (const std::regex_error& e) {
      r.errors.push_back("dangerous_patterns: invalid regex '" + pattern + "': " + e.what());
    }
  }

  const auto timeout = jsonlite::get_u64(obj, "default_timeout_seconds", 30);
  if (timeout < static_cast<unsigned long long>(kMinTimeoutSeconds) ||
      timeout > static_cast<unsigned long long>(kMaxTimeoutSeconds)) {
    r.warnings.push_back("default_timeout_seconds outside [1,300] is clamped");
  }
  if (obj.find("interpreter_args") != obj.end() &&
      jsonlite::get_string_array(obj, "interpreter_args").empty()) {
    r.warnings.push_back("interpreter_args is empty: guest runs without isolated mode (-I)");
  }

  r.ok = r.errors.empty();
  return r;
}

bool apply_config_json(const std::string& config_json, EngineConfig& config, std::string* error) {
  const auto check = validate_config(config_json);
  if (!check.ok) {
    if (error) *error = check.errors.front();
    return false;
  }
  const auto obj = jsonlite::parse(config_json, nullptr);
  auto has = [&](const char* key) { return obj.find(key) != obj.end(); };

  if (has("workspace_dir")) config.workspace_dir = jsonlite::get_string(obj, "workspace_dir");
  if (has("interpreter")) config.interpreter = jsonlite::get_string(obj, "interpreter");
  if (has("interpreter_args")) config.interpreter_args = jsonlite::get_string_array(obj, "interpreter_args");
  if (has("source_extension")) config.source_extension = jsonlite::get_string(obj, "source_extension");
  if (has("deny_modules")) config.validation.deny_modules = jsonlite::get_string_array(obj, "deny_modules");
  if (has("deny_calls")) config.validation.deny_calls = jsonlite::get_string_array(obj, "deny_calls");
  if (has("dangerous_patterns")) {
    config.validation.dangerous_patterns = jsonlite::get_string_array(obj, "dangerous_patterns");
  }
  if (has("env_allowlist")) config.env_allowlist = jsonlite::get_string_array(obj, "env_allowlist");
  if (has("injected_env")) config.injected_env = jsonlite::get_string_map(obj, "injected_env");
  if (has("max_memory_bytes")) config.max_memory_bytes = jsonlite::get_u64(obj, "max_memory_bytes");
  if (has("max_file_size_bytes")) config.max_file_size_bytes = jsonlite::get_u64(obj, "max_file_size_bytes");
  if (has("max_open_files")) config.max_open_files = jsonlite::get_u64(obj, "max_open_files");
  if (has("output_cap_bytes")) config.output_cap_bytes = jsonlite::get_u64(obj, "output_cap_bytes");
  if (has("preview_cap_bytes")) config.preview_cap_bytes = jsonlite::get_u64(obj, "preview_cap_bytes");
  if (has("default_timeout_seconds")) {
    config.default_timeout_seconds = clamp_timeout_seconds(saturate_int(jsonlite::get_u64(obj, "default_timeout_seconds")));
  }
  if (has("resolver_timeout_seconds")) {
    config.resolver_timeout_seconds = clamp_timeout_seconds(saturate_int(jsonlite::get_u64(obj, "resolver_timeout_seconds")));
  }
  if (has("fixer_command")) config.fixer_command = jsonlite::get_string_array(obj, "fixer_command");
  if (has("fixer_timeout_seconds")) {
    config.fixer_timeout_seconds = clamp_timeout_seconds(saturate_int(jsonlite::get_u64(obj, "fixer_timeout_seconds")));
  }
  if (has("link_session_root")) config.link_session_root = jsonlite::get_bool(obj, "link_session_root", true);
  if (has("sandbox_enabled")) config.sandbox_enabled = jsonlite::get_bool(obj, "sandbox_enabled", true);
  if (has("artifact_log_path")) config.artifact_log_path = jsonlite::get_string(obj, "artifact_log_path");
  return true;
}

bool load_config_file(const std::string& path, EngineConfig& config, std::string* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = "cannot open config file: " + path;
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return apply_config_json(text, config, error);
}

std::string config_validation_to_json(const ConfigValidationResult& r) {
  auto list = [](const std::vector<std::string>& v) {
    std::string out = "[";
    for (size_t i = 0; i < v.size(); ++i) {
      if (i) out += ',';
      out += "\"" + jsonlite::escape(v[i]) + "\"";
    }
    return out + "]";
  };
  std::ostringstream o;
  o << "{\"ok\":" << (r.ok ? "true" : "false")
    << ",\"config_version\":\"" << jsonlite::escape(r.config_version) << "\""
    << ",\"errors\":" << list(r.errors)
    << ",\"warnings\":" << list(r.warnings) << "}";
  return o.str();
}

}  // namespace scriptward
