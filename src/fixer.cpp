#include "scriptward/fixer.hpp"

#include <unistd.h>

#include <atomic>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string_view>

#include "scriptward/config.hpp"
#include "scriptward/jsonlite.hpp"
#include "scriptward/sandbox.hpp"

namespace fs = std::filesystem;

namespace scriptward {

namespace {

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

fs::path request_file_path() {
  static std::atomic<unsigned> counter{0};
  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec) dir = "/tmp";
  return dir / ("scriptward-fix-" + std::to_string(::getpid()) + "-" +
                std::to_string(counter.fetch_add(1)) + ".json");
}

// First `File "<path>", line <n>` in a traceback line. Guest stderr can be
// arbitrarily long, so this is a linear scan rather than a regex.
std::optional<ErrorLocation> frame_location(const std::string& line) {
  static constexpr std::string_view kFile = "File \"";
  static constexpr std::string_view kLine = "\", line ";
  size_t at = line.find(kFile);
  while (at != std::string::npos) {
    const size_t path_begin = at + kFile.size();
    const size_t quote = line.find('"', path_begin);
    if (quote == std::string::npos) return std::nullopt;
    const size_t digits = quote + kLine.size();
    if (quote > path_begin && line.compare(quote, kLine.size(), kLine) == 0 &&
        digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits]))) {
      ErrorLocation loc;
      loc.file = line.substr(path_begin, quote - path_begin);
      const auto res = std::from_chars(line.data() + digits, line.data() + line.size(), loc.line);
      if (res.ec == std::errc()) return loc;
    }
    at = line.find(kFile, at + 1);
  }
  return std::nullopt;
}

}  // namespace

ErrorDetail parse_error_detail(const std::string& stderr_text, std::size_t raw_cap) {
  ErrorDetail detail;
  const std::string text = trim(stderr_text);
  if (text.empty()) return detail;

  const std::vector<std::string> lines = split_lines(text);
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    const std::string line = trim(*it);
    if (line.empty()) continue;
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
      detail.type = trim(line.substr(0, colon));
      detail.message = trim(line.substr(colon + 1));
    }
    break;
  }

  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    if (auto loc = frame_location(*it)) {
      detail.location = std::move(loc);
      break;
    }
  }

  detail.raw = truncate_utf8(text, raw_cap);
  return detail;
}

std::optional<std::string> prepend_import(const std::string& source, const std::string& import_line) {
  if (source.empty()) return import_line + "\n";
  std::vector<std::string> lines = split_lines(source);
  if (source.find(import_line) != std::string::npos) return std::nullopt;

  size_t insert_at = 0;
  if (!lines.empty() && lines[0].starts_with("#!")) insert_at = 1;
  while (insert_at < lines.size()) {
    const std::string t = trim(lines[insert_at]);
    if (!t.empty() && t[0] != '#') break;
    ++insert_at;
  }
  lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(insert_at), import_line);

  std::string out;
  out.reserve(source.size() + import_line.size() + 1);
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += '\n';
    out += lines[i];
  }
  if (source.back() == '\n') out += '\n';
  return out;
}

std::string strip_code_fences(const std::string& text) {
  std::string t = trim(text);
  if (t.starts_with("```")) {
    size_t pos = 3;
    while (pos < t.size() && (std::isalnum(static_cast<unsigned char>(t[pos])) || t[pos] == '_' ||
                              t[pos] == '-')) {
      ++pos;
    }
    t = t.substr(pos);
    t = trim(t);
    if (t.ends_with("```")) t = t.substr(0, t.size() - 3);
  }
  return trim(t);
}

std::vector<HeuristicRule> default_heuristic_rules() {
  return {
      {"NameError", "name 'np' is not defined", "import numpy as np", "heuristic_import_numpy"},
      {"NameError", "name 'pd' is not defined", "import pandas as pd", "heuristic_import_pandas"},
      {"NameError", "name 'plt' is not defined", "import matplotlib.pyplot as plt",
       "heuristic_import_matplotlib"},
  };
}

std::optional<FixSuggestion> HeuristicFixer::suggest(const ErrorDetail& error,
                                                     const std::string& source) const {
  for (const auto& rule : rules_) {
    if (error.type != rule.error_type) continue;
    if (error.message.find(rule.message_fragment) == std::string::npos) continue;
    auto fixed = prepend_import(source, rule.import_line);
    if (!fixed) continue;
    return FixSuggestion{std::move(*fixed), rule.method};
  }
  return std::nullopt;
}

std::optional<FixSuggestion> RemoteFixer::suggest(const ErrorDetail& error,
                                                  const std::string& source) const {
  if (!client_) return std::nullopt;
  auto fixed = client_->suggest_fix(error, source);
  if (!fixed || fixed->empty()) return std::nullopt;
  return FixSuggestion{std::move(*fixed), "remote_fixer"};
}

CommandFixClient::CommandFixClient(std::vector<std::string> argv,
                                   std::map<std::string, std::string> env, int timeout_seconds,
                                   std::size_t output_cap_bytes)
    : argv_(std::move(argv)),
      env_(std::move(env)),
      timeout_seconds_(timeout_seconds > 0 ? timeout_seconds : 1),
      output_cap_bytes_(output_cap_bytes) {}

std::optional<std::string> CommandFixClient::suggest_fix(const ErrorDetail& error,
                                                         const std::string& source) const {
  if (argv_.empty()) return std::nullopt;
  const std::string command = find_executable(argv_[0]);
  if (command.empty()) return std::nullopt;

  const fs::path request_path = request_file_path();
  {
    std::ofstream out(request_path, std::ios::binary | std::ios::trunc);
    if (!out) return std::nullopt;
    out << "{\"error\":" << error_detail_to_json(error) << ",\"source\":\""
        << jsonlite::escape(source) << "\"}";
    if (!out) {
      std::error_code ec;
      fs::remove(request_path, ec);
      return std::nullopt;
    }
  }

  ProcessSpec spec;
  spec.command = command;
  spec.argv.assign(argv_.begin() + 1, argv_.end());
  spec.argv.push_back(request_path.string());
  spec.env = env_;
  spec.timeout_ms = static_cast<std::uint64_t>(timeout_seconds_) * 1000;
  spec.max_output_bytes = output_cap_bytes_;
  const ProcessResult r = run_process(spec);

  std::error_code ec;
  fs::remove(request_path, ec);

  if (!r.spawned || r.timed_out || r.exit_code != 0 || r.stdout_truncated) return std::nullopt;
  std::string fixed = strip_code_fences(r.stdout_text);
  if (fixed.empty()) return std::nullopt;
  return fixed;
}

}  // namespace scriptward
