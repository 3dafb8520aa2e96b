#include "scriptward/types.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

#include "scriptward/jsonlite.hpp"
#include "scriptward/version.hpp"

namespace scriptward {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::path_escape: return "path_escape";
    case ErrorCode::io_failed: return "io_failed";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::publisher_failed: return "publisher_failed";
  }
  return "";
}

std::string to_string(RunStatus status) {
  switch (status) {
    case RunStatus::ok: return "ok";
    case RunStatus::error: return "error";
    case RunStatus::timeout: return "timeout";
    case RunStatus::blocked: return "blocked";
    case RunStatus::syntax_error: return "syntax_error";
    case RunStatus::deps_missing: return "deps_missing";
  }
  return "error";
}

std::optional<RunStatus> parse_run_status(const std::string& text) {
  if (text == "ok") return RunStatus::ok;
  if (text == "error") return RunStatus::error;
  if (text == "timeout") return RunStatus::timeout;
  if (text == "blocked") return RunStatus::blocked;
  if (text == "syntax_error") return RunStatus::syntax_error;
  if (text == "deps_missing") return RunStatus::deps_missing;
  return std::nullopt;
}

std::string format_utc_iso(std::int64_t unix_ns) {
  std::int64_t secs = unix_ns / 1000000000;
  std::int64_t rem_ns = unix_ns % 1000000000;
  if (rem_ns < 0) {
    rem_ns += 1000000000;
    --secs;
  }
  const std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(rem_ns / 1000));
  return buf;
}

std::string utc_now_iso() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return format_utc_iso(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------
// MICRO_OPT: pre-reserved std::string appends instead of ostringstream.

std::string truncate_utf8(const std::string& text, std::size_t limit) {
  if (text.size() <= limit) return text;
  std::size_t cut = limit;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
  return text.substr(0, cut);
}

std::string to_valid_utf8(const std::string& text) {
  static const char kReplacement[] = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(text.size());
  const std::size_t n = text.size();
  std::size_t i = 0;
  while (i < n) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    }
    bool valid = len > 0 && i + len <= n;
    for (std::size_t k = 1; valid && k < len; ++k) {
      const unsigned char cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80) valid = false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Reject overlong forms, surrogates and values past U+10FFFF.
    if (valid) {
      const std::uint32_t min_cp = len == 2 ? 0x80 : len == 3 ? 0x800 : 0x10000;
      if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) valid = false;
    }
    if (valid) {
      out.append(text, i, len);
      i += len;
    } else {
      out += kReplacement;
      ++i;
    }
  }
  return out;
}

namespace {

void append_str(std::string& out, const std::string& key, const std::string& value) {
  out += '"';
  out += key;
  out += "\":\"";
  out += jsonlite::escape(value);
  out += '"';
}

std::string str_array_json(const std::vector<std::string>& a) {
  std::string out;
  out.reserve(a.size() * 24 + 2);
  out += '[';
  for (size_t i = 0; i < a.size(); ++i) {
    if (i) out += ',';
    out += '"';
    out += jsonlite::escape(a[i]);
    out += '"';
  }
  out += ']';
  return out;
}

std::string nullable_str(const std::string& s) {
  if (s.empty()) return "null";
  return "\"" + jsonlite::escape(s) + "\"";
}

}  // namespace

std::string validation_to_json(const ValidationResult& v) {
  std::string out;
  out.reserve(128);
  out += "{\"ok\":";
  out += v.ok ? "true" : "false";
  out += ',';
  append_str(out, "status", to_string(v.status));
  out += ",\"reasons\":";
  out += str_array_json(v.reasons);
  out += ",\"imports\":";
  out += str_array_json(v.imports);
  out += '}';
  return out;
}

std::string error_detail_to_json(const ErrorDetail& e) {
  std::string out;
  out.reserve(64 + e.raw.size());
  out += "{\"type\":";
  out += nullable_str(e.type);
  out += ",\"message\":";
  out += nullable_str(e.message);
  out += ",\"location\":";
  if (e.location) {
    out += '{';
    append_str(out, "file", e.location->file);
    out += ",\"line\":";
    out += std::to_string(e.location->line);
    out += '}';
  } else {
    out += "null";
  }
  out += ',';
  append_str(out, "raw", e.raw);
  out += '}';
  return out;
}

std::string attempt_to_json(const Attempt& a) {
  std::string out;
  out.reserve(256 + a.code_preview.size() + a.stdout_text.size() + a.stderr_text.size());
  out += "{\"attempt\":";
  out += std::to_string(a.attempt);
  out += ',';
  append_str(out, "status", to_string(a.status));
  out += ',';
  append_str(out, "code_sha256", a.code_sha256);
  append_str(out, "code_digest", a.code_digest);
  out += ',';
  append_str(out, "code_preview", a.code_preview);
  out += ',';
  append_str(out, "stdout", a.stdout_text);
  out += ',';
  append_str(out, "stderr", a.stderr_text);
  out += ",\"error\":";
  out += error_detail_to_json(a.error);
  out += ",\"execution_time_seconds\":";
  out += jsonlite::format_double(a.execution_time_seconds);
  if (a.autocorrect) {
    out += ",\"autocorrect\":{\"applied\":";
    out += a.autocorrect->applied ? "true" : "false";
    out += ',';
    append_str(out, "method", a.autocorrect->method);
    if (!a.autocorrect->rejected_reason.empty()) {
      out += ',';
      append_str(out, "rejected_reason", a.autocorrect->rejected_reason);
    }
    out += '}';
  }
  out += '}';
  return out;
}

std::string file_meta_to_json(const FileMeta& f) {
  std::string out;
  out.reserve(128);
  out += '{';
  append_str(out, "path", f.path);
  out += ",\"size_bytes\":";
  out += std::to_string(f.size_bytes);
  out += ',';
  append_str(out, "modified_at", f.modified_at);
  out += ",\"mime_type\":";
  out += nullable_str(f.mime_type);
  out += '}';
  return out;
}

std::string run_to_json(const Run& r) {
  std::string out;
  out.reserve(1024 + r.stdout_text.size() + r.stderr_text.size());
  out += "{\"format_version\":";
  out += std::to_string(version::LEDGER_FORMAT_VERSION);
  out += ',';
  append_str(out, "run_id", r.run_id);
  out += ',';
  append_str(out, "session_id", r.session_id);
  out += ',';
  append_str(out, "started_at", r.started_at);
  out += ',';
  append_str(out, "status", to_string(r.status));
  out += ',';
  append_str(out, "stdout", r.stdout_text);
  out += ',';
  append_str(out, "stderr", r.stderr_text);
  out += ",\"execution_time_seconds\":";
  out += jsonlite::format_double(r.execution_time_seconds);
  out += ",\"created_files\":[";
  for (size_t i = 0; i < r.created_files.size(); ++i) {
    if (i) out += ',';
    out += file_meta_to_json(r.created_files[i]);
  }
  out += "],\"attempts\":[";
  for (size_t i = 0; i < r.attempts.size(); ++i) {
    if (i) out += ',';
    out += attempt_to_json(r.attempts[i]);
  }
  out += "],\"validation\":";
  out += validation_to_json(r.validation);
  if (r.status == RunStatus::deps_missing) {
    out += ",\"missing_dependencies\":";
    out += str_array_json(r.missing_dependencies);
  }
  out += '}';
  return out;
}

std::string run_summary_to_json(const RunSummary& s) {
  std::string out;
  out.reserve(160);
  out += '{';
  append_str(out, "run_id", s.run_id);
  out += ',';
  append_str(out, "started_at", s.started_at);
  out += ',';
  append_str(out, "status", to_string(s.status));
  out += ",\"execution_time_seconds\":";
  out += jsonlite::format_double(s.execution_time_seconds);
  out += ",\"created_files\":";
  out += str_array_json(s.created_files);
  out += '}';
  return out;
}

std::string run_list_to_json(const RunList& l) {
  std::string out;
  out += '{';
  append_str(out, "session_id", l.session_id);
  out += ",\"items\":[";
  for (size_t i = 0; i < l.items.size(); ++i) {
    if (i) out += ',';
    out += run_summary_to_json(l.items[i]);
  }
  out += "]}";
  return out;
}

std::string cleanup_report_to_json(const CleanupReport& c) {
  std::string out;
  out += '{';
  append_str(out, "session_id", c.session_id);
  out += ",\"removed_runs\":";
  out += std::to_string(c.removed_runs);
  out += ",\"removed_files\":";
  out += std::to_string(c.removed_files);
  out += '}';
  return out;
}

std::optional<RunSummary> parse_run_summary(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(line, &err);
  if (err) return std::nullopt;

  RunSummary s;
  s.run_id = jsonlite::get_string(obj, "run_id");
  s.started_at = jsonlite::get_string(obj, "started_at");
  auto status = parse_run_status(jsonlite::get_string(obj, "status"));
  if (s.run_id.empty() || s.started_at.empty() || !status) return std::nullopt;
  s.status = *status;
  s.execution_time_seconds = jsonlite::get_double(obj, "execution_time_seconds", 0.0);
  s.created_files = jsonlite::get_string_array(obj, "created_files");
  return s;
}

RunSummary summarize(const Run& run) {
  RunSummary s;
  s.run_id = run.run_id;
  s.started_at = run.started_at;
  s.status = run.status;
  s.execution_time_seconds = run.execution_time_seconds;
  s.created_files.reserve(run.created_files.size());
  for (const auto& f : run.created_files) s.created_files.push_back(f.path);
  return s;
}

}  // namespace scriptward
