#pragma once

// scriptward/types.hpp - Core data structures for the sandboxed script engine.
//
// OWNERSHIP:
//   - All records are value types. Every string member is owned.
//   - Engine::execute() returns Run by value; the caller owns it.
//   - No raw pointer members in any public API type.
//
// ERROR MODEL:
//   Normal outcomes (blocked, syntax_error, deps_missing, error, timeout) are
//   never raised. They are terminal RunStatus values on a Run.
//   Infrastructure failures (cannot create the run directory, cannot spawn the
//   interpreter, workspace refuses a path) throw EngineError with an ErrorCode.

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace scriptward {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  path_escape,
  io_failed,
  spawn_failed,
  timeout,
  config_invalid,
  publisher_failed,
};

std::string to_string(ErrorCode code);

// Thrown only for infrastructure failures. Carries the ErrorCode so callers
// (the CLI in particular) can report a stable machine-readable category.
class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Terminal outcome of a Run or an Attempt. Validation reuses the first three
// values (ok, blocked, syntax_error).
enum class RunStatus {
  ok,
  error,
  timeout,
  blocked,
  syntax_error,
  deps_missing,
};

std::string to_string(RunStatus status);
std::optional<RunStatus> parse_run_status(const std::string& text);

struct ValidationResult {
  bool ok{false};
  RunStatus status{RunStatus::blocked};
  std::vector<std::string> reasons;
  std::vector<std::string> imports;  // sorted, deduplicated import roots
};

struct ErrorLocation {
  std::string file;
  int line{0};
};

// Parsed from the guest's stderr. type/message stay empty when the last
// non-empty stderr line carries no "Type: message" shape.
struct ErrorDetail {
  std::string type;
  std::string message;
  std::optional<ErrorLocation> location;
  std::string raw;
};

struct AutocorrectInfo {
  bool applied{false};
  std::string method;
  std::string rejected_reason;  // set only when a produced fix was discarded
};

struct Attempt {
  int attempt{1};
  RunStatus status{RunStatus::error};
  std::string code_sha256;
  std::string code_digest;
  std::string code_preview;
  std::string stdout_text;
  std::string stderr_text;
  ErrorDetail error;
  double execution_time_seconds{0.0};
  std::optional<AutocorrectInfo> autocorrect;
};

struct FileMeta {
  std::string path;  // relative to the run directory, '/'-separated
  std::uint64_t size_bytes{0};
  std::string modified_at;
  std::string mime_type;
};

struct Run {
  std::string run_id;
  std::string session_id;
  std::string started_at;
  RunStatus status{RunStatus::error};
  std::string stdout_text;
  std::string stderr_text;
  double execution_time_seconds{0.0};
  std::vector<FileMeta> created_files;
  std::vector<Attempt> attempts;
  ValidationResult validation;
  std::vector<std::string> missing_dependencies;
};

// One line of the per-session index.
struct RunSummary {
  std::string run_id;
  std::string started_at;
  RunStatus status{RunStatus::error};
  double execution_time_seconds{0.0};
  std::vector<std::string> created_files;
};

struct RunList {
  std::string session_id;
  std::vector<RunSummary> items;
};

struct CleanupReport {
  std::string session_id;
  std::uint64_t removed_runs{0};
  std::uint64_t removed_files{0};
};

struct ExecuteRequest {
  std::string session_id;
  std::string source;
  int timeout_seconds{30};
  bool auto_correct{true};
  int max_attempts{3};
};

// UTC ISO-8601 with microseconds and a 'Z' suffix, e.g.
// 2026-01-02T03:04:05.123456Z. Lexicographic order equals time order.
std::string utc_now_iso();
std::string format_utc_iso(std::int64_t unix_ns);

// Cuts text to at most limit bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& text, std::size_t limit);

// Replaces every invalid UTF-8 sequence with U+FFFD. Guest output is decoded
// through this before it reaches any JSON document.
std::string to_valid_utf8(const std::string& text);

// Serialization. Field names are the on-disk ledger contract.
std::string validation_to_json(const ValidationResult& v);
std::string error_detail_to_json(const ErrorDetail& e);
std::string attempt_to_json(const Attempt& a);
std::string file_meta_to_json(const FileMeta& f);
std::string run_to_json(const Run& r);
std::string run_summary_to_json(const RunSummary& s);
std::string run_list_to_json(const RunList& l);
std::string cleanup_report_to_json(const CleanupReport& c);

// Parses one index line. Returns nullopt for malformed lines.
std::optional<RunSummary> parse_run_summary(const std::string& line);

RunSummary summarize(const Run& run);

}  // namespace scriptward
