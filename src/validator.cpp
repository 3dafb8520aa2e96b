#include "scriptward/validator.hpp"

#include <algorithm>
#include <set>
#include <string_view>

namespace scriptward {

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n\f\v");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n\f\v");
  return s.substr(b, e - b + 1);
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) out += sep;
    out += items[i];
  }
  return out;
}

// std::regex recursion grows with the length of the matched text, so the
// patterns only ever see one source line at a time, with blank runs collapsed
// and long lines cut into overlapping windows.
constexpr size_t kPatternWindow = 1024;
constexpr size_t kPatternOverlap = 256;

std::string collapse_blanks(std::string_view line) {
  std::string out;
  out.reserve(std::min(line.size(), kPatternWindow));
  bool in_run = false;
  for (char c : line) {
    const bool blank = c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
    if (blank) {
      if (!in_run) out += ' ';
      in_run = true;
      continue;
    }
    in_run = false;
    out += c;
  }
  return out;
}

bool line_matches(const std::string& line, const std::regex& re) {
  for (size_t off = 0;; off += kPatternWindow - kPatternOverlap) {
    const size_t len = std::min(kPatternWindow, line.size() - off);
    const auto first = line.begin() + static_cast<std::ptrdiff_t>(off);
    const auto flags = off == 0 ? std::regex_constants::match_default
                                : std::regex_constants::match_prev_avail;
    if (std::regex_search(first, first + static_cast<std::ptrdiff_t>(len), re, flags)) return true;
    if (off + len >= line.size()) return false;
  }
}

bool source_matches(const std::string& source, const std::regex& re) {
  size_t start = 0;
  while (true) {
    size_t end = source.find('\n', start);
    if (end == std::string::npos) end = source.size();
    const std::string_view line(source.data() + start, end - start);
    if (line_matches(collapse_blanks(line), re)) return true;
    if (end == source.size()) return false;
    start = end + 1;
  }
}

}  // namespace

std::string module_root(const std::string& module) {
  return trim(module.substr(0, module.find('.')));
}

bool is_unsafe_literal_path(const std::string& path) {
  const std::string p = trim(path);
  if (p.empty()) return false;
  return p.front() == '/' || p.front() == '~' || p.front() == '\\' ||
         p.find("..") != std::string::npos;
}

Validator::Validator(ValidationPolicy policy, std::shared_ptr<const Parser> parser)
    : policy_(std::move(policy)), parser_(std::move(parser)) {
  patterns_.reserve(policy_.dangerous_patterns.size());
  for (const auto& pattern : policy_.dangerous_patterns) {
    try {
      patterns_.emplace_back(pattern, std::regex(pattern, std::regex::ECMAScript | std::regex::icase));
    } catch (const std::regex_error& e) {
      throw EngineError(ErrorCode::config_invalid,
                        "invalid dangerous pattern '" + pattern + "': " + e.what());
    }
  }
}

bool Validator::is_denied_module(const std::string& root) const {
  return std::find(policy_.deny_modules.begin(), policy_.deny_modules.end(), root) !=
         policy_.deny_modules.end();
}

ValidationResult Validator::validate(const std::string& source) const {
  ValidationResult result;
  const ParseOutcome parsed = parser_->parse(source);
  if (!parsed.ok) {
    std::string msg = parsed.message.empty() ? "SyntaxError" : parsed.message;
    if (parsed.position.line > 0) {
      msg += " (line " + std::to_string(parsed.position.line);
      if (parsed.position.column > 0) msg += ":" + std::to_string(parsed.position.column);
      msg += ")";
    }
    if (!parsed.source_line.empty()) msg += "\n" + parsed.source_line;
    result.ok = false;
    result.status = RunStatus::syntax_error;
    result.reasons.push_back(std::move(msg));
    return result;
  }

  std::set<std::string> roots;
  for (const auto& module : parsed.imports) {
    std::string root = module_root(module);
    if (!root.empty()) roots.insert(std::move(root));
  }
  result.imports.assign(roots.begin(), roots.end());

  for (const auto& [text, re] : patterns_) {
    if (source_matches(source, re)) {
      result.reasons.push_back("dangerous pattern detected: " + text);
    }
  }

  std::vector<std::string> blocked;
  for (const auto& root : result.imports) {
    if (is_denied_module(root)) blocked.push_back(root);
  }
  if (!blocked.empty()) {
    result.reasons.push_back("imports not allowed: " + join(blocked, ", "));
  }

  for (const auto& call : parsed.calls) {
    if (std::find(policy_.deny_calls.begin(), policy_.deny_calls.end(), call.name) !=
        policy_.deny_calls.end()) {
      result.reasons.push_back("call not allowed: " + call.name + "() (line " +
                               std::to_string(call.position.line) + ")");
    }
    if (call.name == "open" && call.first_literal && is_unsafe_literal_path(*call.first_literal)) {
      result.reasons.push_back("path not allowed in open(): " + trim(*call.first_literal));
    }
  }

  result.ok = result.reasons.empty();
  result.status = result.ok ? RunStatus::ok : RunStatus::blocked;
  return result;
}

}  // namespace scriptward
