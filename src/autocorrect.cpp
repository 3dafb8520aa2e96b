#include "scriptward/autocorrect.hpp"

#include "scriptward/config.hpp"
#include "scriptward/hash.hpp"

namespace scriptward {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) out += sep;
    out += items[i];
  }
  return out;
}

std::string missing_message(const std::vector<std::string>& missing) {
  return "missing dependencies: " + join(missing, ", ");
}

}  // namespace

Attempt AutoCorrectController::synthetic_attempt(const std::string& source, RunStatus status,
                                                 const std::string& error_type,
                                                 const std::string& stderr_text) const {
  Attempt a;
  a.attempt = 1;
  a.status = status;
  a.code_sha256 = sha256_hex(source);
  a.code_digest = code_digest(source);
  a.code_preview = truncate_utf8(source, limits_.preview_cap_bytes);
  a.stderr_text = truncate_utf8(stderr_text, limits_.output_cap_bytes);
  a.error.type = error_type;
  const auto nl = stderr_text.find('\n');
  a.error.message = stderr_text.substr(0, nl);
  a.error.raw = truncate_utf8(stderr_text, limits_.error_raw_cap_bytes);
  a.execution_time_seconds = 0.0;
  return a;
}

ControllerOutcome AutoCorrectController::run(const std::string& source, int timeout_seconds,
                                             bool auto_correct, int max_attempts,
                                             AttemptRunner& runner, const AttemptSink& sink) const {
  const int timeout = clamp_timeout_seconds(timeout_seconds);
  const int budget = clamp_max_attempts(max_attempts);
  ControllerOutcome out;

  // VALIDATING (original source)
  out.validation = validator_.validate(source);
  if (!out.validation.ok) {
    out.status = out.validation.status;
    out.stderr_text = truncate_utf8(join(out.validation.reasons, "\n"), limits_.output_cap_bytes);
    const char* type =
        out.status == RunStatus::syntax_error ? "SyntaxError" : "SecurityViolation";
    out.attempts.push_back(synthetic_attempt(source, out.status, type, out.stderr_text));
    sink(out.attempts.back());
    return out;
  }
  out.missing_dependencies = find_missing_dependencies(out.validation.imports, validator_, resolver_);
  if (!out.missing_dependencies.empty()) {
    out.status = RunStatus::deps_missing;
    out.stderr_text = missing_message(out.missing_dependencies);
    out.attempts.push_back(
        synthetic_attempt(source, out.status, "MissingDependency", out.stderr_text));
    sink(out.attempts.back());
    return out;
  }

  std::string current = source;
  for (int n = 1; n <= budget; ++n) {
    // EXECUTING
    AttemptOutcome exec = runner.run(current, timeout);
    out.execution_time_seconds += exec.execution_time_seconds;

    Attempt a;
    a.attempt = n;
    a.status = exec.status;
    a.code_sha256 = sha256_hex(current);
    a.code_digest = code_digest(current);
    a.code_preview = truncate_utf8(current, limits_.preview_cap_bytes);
    a.stdout_text = truncate_utf8(exec.stdout_text, limits_.output_cap_bytes);
    a.stderr_text = truncate_utf8(exec.stderr_text, limits_.output_cap_bytes);
    a.error = parse_error_detail(exec.stderr_text, limits_.error_raw_cap_bytes);
    a.execution_time_seconds = exec.execution_time_seconds;

    out.status = exec.status;
    out.stdout_text = a.stdout_text;
    out.stderr_text = a.stderr_text;

    if (exec.status == RunStatus::ok) {
      out.created_paths = std::move(exec.changed_paths);
      out.attempts.push_back(std::move(a));
      sink(out.attempts.back());
      break;
    }
    if (exec.status == RunStatus::timeout || !auto_correct || n >= budget) {
      out.attempts.push_back(std::move(a));
      sink(out.attempts.back());
      break;
    }

    // RETRY
    std::optional<FixSuggestion> fix;
    for (const auto& fixer : fixers_) {
      fix = fixer->suggest(a.error, current);
      if (fix && fix->source != current) break;
      fix.reset();
    }
    if (!fix) {
      out.attempts.push_back(std::move(a));
      sink(out.attempts.back());
      break;
    }

    // VALIDATING (proposed fix)
    out.validation = validator_.validate(fix->source);
    std::string rejected;
    if (!out.validation.ok) {
      rejected = "fix rejected by validation (" + to_string(out.validation.status) +
                 "): " + join(out.validation.reasons, "; ");
    } else {
      out.missing_dependencies =
          find_missing_dependencies(out.validation.imports, validator_, resolver_);
      if (!out.missing_dependencies.empty()) {
        rejected = "fix rejected: " + missing_message(out.missing_dependencies);
        out.missing_dependencies.clear();
      }
    }
    if (!rejected.empty()) {
      a.autocorrect = AutocorrectInfo{false, fix->method, rejected};
      out.attempts.push_back(std::move(a));
      sink(out.attempts.back());
      break;
    }

    a.autocorrect = AutocorrectInfo{true, fix->method, ""};
    out.attempts.push_back(std::move(a));
    sink(out.attempts.back());
    current = std::move(fix->source);
  }
  return out;
}

}  // namespace scriptward
