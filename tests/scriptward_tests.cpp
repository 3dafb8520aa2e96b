// scriptward test suite. Self-contained harness: expect() aborts the binary on
// the first failure so CTest reports it.

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "scriptward/artifacts.hpp"
#include "scriptward/autocorrect.hpp"
#include "scriptward/config.hpp"
#include "scriptward/engine.hpp"
#include "scriptward/fixer.hpp"
#include "scriptward/hash.hpp"
#include "scriptward/jsonlite.hpp"
#include "scriptward/ledger.hpp"
#include "scriptward/observability.hpp"
#include "scriptward/parser.hpp"
#include "scriptward/resolver.hpp"
#include "scriptward/retention.hpp"
#include "scriptward/sandbox.hpp"
#include "scriptward/types.hpp"
#include "scriptward/validator.hpp"
#include "scriptward/version.hpp"
#include "scriptward/workspace.hpp"

namespace fs = std::filesystem;
using namespace scriptward;

namespace {

int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;
bool g_skip = false;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void skip(const std::string& why) {
  std::cout << " SKIPPED (" << why << ")\n";
  g_skip = true;
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "..." << std::flush;
  fn();
  g_tests_run++;
  if (g_skip) {
    g_skip = false;
    g_tests_skipped++;
    g_tests_passed++;
    return;
  }
  std::cout << " PASSED\n";
  g_tests_passed++;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() /
                     ("scriptward_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

void write_text(const fs::path& p, const std::string& text) {
  fs::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << text;
}

std::string read_text(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::vector<std::string> read_lines(const fs::path& p) {
  std::vector<std::string> lines;
  std::ifstream in(p);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

std::map<std::string, std::string> shell_env() {
  return {{"PATH", "/usr/bin:/bin"}};
}

Validator default_validator() {
  return Validator(ValidationPolicy::defaults(), std::make_shared<const PythonTokenParser>());
}

std::string python() { return find_interpreter(); }

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

// Grants a root but refuses every path resolved under it.
class RefusingWorkspace final : public Workspace {
 public:
  explicit RefusingWorkspace(fs::path root) : root_(std::move(root)) {}
  fs::path root() const override {
    fs::create_directories(root_);
    return root_;
  }
  std::optional<fs::path> safe_path(const std::string&) const override { return std::nullopt; }

 private:
  fs::path root_;
};

class FakeResolver final : public ModuleResolver {
 public:
  explicit FakeResolver(std::set<std::string> missing = {}) : missing_(std::move(missing)) {}
  std::vector<std::string> unresolvable(const std::vector<std::string>& roots) const override {
    calls_++;
    std::vector<std::string> out;
    for (const auto& r : roots) {
      if (missing_.contains(r)) out.push_back(r);
    }
    return out;
  }
  mutable int calls_{0};

 private:
  std::set<std::string> missing_;
};

class ScriptedRunner final : public AttemptRunner {
 public:
  explicit ScriptedRunner(std::vector<AttemptOutcome> outcomes) : outcomes_(std::move(outcomes)) {}
  AttemptOutcome run(const std::string& source, int timeout_seconds) override {
    sources.push_back(source);
    timeouts.push_back(timeout_seconds);
    const size_t i = std::min(sources.size() - 1, outcomes_.size() - 1);
    return outcomes_[i];
  }
  std::vector<std::string> sources;
  std::vector<int> timeouts;

 private:
  std::vector<AttemptOutcome> outcomes_;
};

class FixedFixer final : public Fixer {
 public:
  FixedFixer(std::string source, std::string method)
      : source_(std::move(source)), method_(std::move(method)) {}
  std::string name() const override { return method_; }
  std::optional<FixSuggestion> suggest(const ErrorDetail&, const std::string&) const override {
    return FixSuggestion{source_, method_};
  }

 private:
  std::string source_;
  std::string method_;
};

// Appends a numbered comment so each proposal differs from its input.
class CountingFixer final : public Fixer {
 public:
  std::string name() const override { return "counting"; }
  std::optional<FixSuggestion> suggest(const ErrorDetail&, const std::string& source) const override {
    return FixSuggestion{source + "# fix " + std::to_string(++count_) + "\n", "counting"};
  }
  mutable int count_{0};
};

class EchoFixer final : public Fixer {
 public:
  std::string name() const override { return "echo"; }
  std::optional<FixSuggestion> suggest(const ErrorDetail&, const std::string& source) const override {
    return FixSuggestion{source, "echo"};
  }
};

class FakeRemoteClient final : public RemoteFixClient {
 public:
  explicit FakeRemoteClient(std::optional<std::string> answer) : answer_(std::move(answer)) {}
  std::optional<std::string> suggest_fix(const ErrorDetail&, const std::string&) const override {
    return answer_;
  }

 private:
  std::optional<std::string> answer_;
};

class RecordingPublisher final : public ArtifactPublisher {
 public:
  void publish(const ArtifactEvent& ev) override { events.push_back(ev); }
  std::vector<ArtifactEvent> events;
};

class ThrowingPublisher final : public ArtifactPublisher {
 public:
  void publish(const ArtifactEvent&) override {
    throw EngineError(ErrorCode::publisher_failed, "bus down");
  }
};

AttemptOutcome outcome(RunStatus status, const std::string& stderr_text = "",
                       std::vector<std::string> changed = {}) {
  AttemptOutcome o;
  o.status = status;
  o.stderr_text = stderr_text;
  o.execution_time_seconds = 0.25;
  o.changed_paths = std::move(changed);
  return o;
}

const char* kNameErrorNp =
    "Traceback (most recent call last):\n"
    "  File \"/w/runs/r/source.py\", line 1, in <module>\n"
    "    x = np.zeros(3)\n"
    "NameError: name 'np' is not defined\n";

ControllerOutcome run_controller(const Validator& v, const ModuleResolver& r,
                                 std::vector<std::shared_ptr<const Fixer>> fixers,
                                 const std::string& source, AttemptRunner& runner,
                                 int max_attempts = 3, bool auto_correct = true,
                                 int timeout = 30, std::vector<Attempt>* sunk = nullptr) {
  const AutoCorrectController controller(v, r, std::move(fixers), ControllerLimits{});
  std::vector<Attempt> local;
  auto& sink_target = sunk ? *sunk : local;
  return controller.run(source, timeout, auto_correct, max_attempts, runner,
                        [&](const Attempt& a) { sink_target.push_back(a); });
}

EngineConfig test_config(const fs::path& workspace) {
  EngineConfig c;
  c.workspace_dir = workspace.string();
  c.interpreter = python();
  c.artifact_log_path.clear();
  c.fixer_command.clear();
  return c;
}

// ---------------------------------------------------------------------------
// Hashing, versions, types
// ---------------------------------------------------------------------------

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 of empty string");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 of 'hello'");
}

void test_code_digest_domain() {
  const std::string src = "print(1)\n";
  expect(code_digest(src).size() == 64, "digest is 64 hex chars");
  expect(code_digest(src) != blake3_hex(src), "code digest is domain separated");
  expect(code_digest(src) == code_digest(src), "digest is stable");
  expect(code_digest(src) != code_digest("print(2)\n"), "digest depends on source");
  expect(hash_runtime_info().primitive == "blake3", "primitive reported");
}

void test_sha256_known_vectors() {
  expect(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
         "SHA-256 of empty string");
  expect(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA-256 of 'abc'");
}

void test_version_manifest() {
  const auto json = version::manifest_to_json(version::current_manifest());
  expect(jsonlite::validate_strict(json) == std::nullopt, "manifest is valid JSON");
  expect(contains(json, "1.0.0"), "manifest carries semver");
}

void test_status_round_trip() {
  for (auto s : {RunStatus::ok, RunStatus::error, RunStatus::timeout, RunStatus::blocked,
                 RunStatus::syntax_error, RunStatus::deps_missing}) {
    expect(parse_run_status(to_string(s)) == s, "status round trip " + to_string(s));
  }
  expect(!parse_run_status("exploded"), "unknown status rejected");
}

void test_utc_iso_format() {
  const std::string t = format_utc_iso(1700000000123456000LL);
  expect(t == "2023-11-14T22:13:20.123456Z", "fixed instant formatted: " + t);
  const std::string now = utc_now_iso();
  expect(now.size() == 27 && now.back() == 'Z' && now[10] == 'T', "now formatted: " + now);
}

void test_utf8_helpers() {
  const std::string s = "a\xC3\xA9";  // "aé"
  expect(truncate_utf8(s, 2) == "a", "does not split a sequence");
  expect(truncate_utf8(s, 3) == s, "fits exactly");
  expect(truncate_utf8("abcdef", 3) == "abc", "ascii cut");
  expect(to_valid_utf8(s) == s, "valid text unchanged");
  expect(to_valid_utf8("x\xFFy") == "x\xEF\xBF\xBDy", "invalid byte replaced");
  expect(to_valid_utf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD", "overlong form replaced");
}

void test_run_json_shape() {
  Run run;
  run.run_id = "20260101T000000000000-abcdefabcdef";
  run.session_id = "s";
  run.started_at = "2026-01-01T00:00:00.000000Z";
  run.status = RunStatus::deps_missing;
  run.stderr_text = "missing dependencies: numpy";
  run.missing_dependencies = {"numpy"};
  Attempt a;
  a.status = RunStatus::deps_missing;
  a.code_sha256 = sha256_hex("import numpy\n");
  a.code_digest = code_digest("import numpy\n");
  a.code_preview = "import numpy\n";
  a.autocorrect = AutocorrectInfo{false, "remote_fixer", "fix rejected"};
  run.attempts.push_back(a);
  FileMeta f;
  f.path = "out/a.bin";
  f.size_bytes = 3;
  f.modified_at = run.started_at;
  run.created_files.push_back(f);

  const std::string json = run_to_json(run);
  expect(jsonlite::validate_strict(json) == std::nullopt, "run JSON is strict-valid");
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  expect(!err, "run JSON parses");
  expect(jsonlite::get_u64(obj, "format_version") == version::LEDGER_FORMAT_VERSION,
         "format_version present");
  expect(jsonlite::get_string(obj, "status") == "deps_missing", "status serialized");
  expect(jsonlite::get_string_array(obj, "missing_dependencies").size() == 1,
         "missing_dependencies present for deps_missing");
  expect(contains(json, "\"mime_type\":null"), "unknown mime serialized as null");
  expect(contains(json, "\"rejected_reason\":\"fix rejected\""), "rejected reason kept");
  expect(contains(json, "\"code_sha256\":\"" + sha256_hex("import numpy\n") + "\""),
         "attempt carries code_sha256");

  run.status = RunStatus::ok;
  expect(!contains(run_to_json(run), "missing_dependencies"),
         "missing_dependencies omitted otherwise");
}

void test_run_summary_parse() {
  RunSummary s;
  s.run_id = "r1";
  s.started_at = "2026-01-01T00:00:00.000000Z";
  s.status = RunStatus::timeout;
  s.execution_time_seconds = 1.5;
  s.created_files = {"a.png"};
  const auto back = parse_run_summary(run_summary_to_json(s));
  expect(back.has_value(), "summary parses");
  expect(back->run_id == "r1" && back->status == RunStatus::timeout, "fields kept");
  expect(back->execution_time_seconds == 1.5, "time kept");
  expect(back->created_files == std::vector<std::string>{"a.png"}, "files kept");

  expect(!parse_run_summary("{not json"), "garbage rejected");
  expect(!parse_run_summary("{\"run_id\":\"x\"}"), "incomplete line rejected");
  expect(!parse_run_summary("{\"run_id\":\"x\",\"started_at\":\"t\",\"status\":\"weird\"}"),
         "unknown status rejected");
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

void test_clamps() {
  expect(clamp_timeout_seconds(0) == 1, "timeout 0 -> 1");
  expect(clamp_timeout_seconds(-5) == 1, "negative timeout -> 1");
  expect(clamp_timeout_seconds(1000) == 300, "timeout 1000 -> 300");
  expect(clamp_max_attempts(10) == 3, "attempts 10 -> 3");
  expect(clamp_max_attempts(0) == 1, "attempts 0 -> 1");
  expect(clamp_list_limit(0) == 1 && clamp_list_limit(500) == 200, "list limit clamp");
  expect(clamp_max_age_hours(0) == 1 && clamp_max_age_hours(10000) == 720, "age clamp");
}

void test_config_validation() {
  auto r = validate_config(R"({"config_version":"1","max_open_files":64,"sandbox_enabled":false})");
  expect(r.ok && r.errors.empty() && r.warnings.empty(), "valid config accepted");

  r = validate_config(R"({"config_version":"2"})");
  expect(!r.ok, "unsupported version rejected");

  r = validate_config(R"({"max_open_files":"many","deny_calls":[1]})");
  expect(!r.ok && r.errors.size() == 2, "type errors reported");
  bool missing_version_warned = false;
  for (const auto& w : r.warnings) missing_version_warned |= contains(w, "config_version");
  expect(missing_version_warned, "missing version warned");

  r = validate_config(R"({"config_version":"1","dangerous_patterns":["(unclosed"]})");
  expect(!r.ok && contains(r.errors.front(), "dangerous_patterns"), "bad regex rejected");

  r = validate_config(R"({"config_version":"1","colour":"blue"})");
  expect(r.ok && r.warnings.size() == 1 && contains(r.warnings[0], "colour"), "unknown key warned");

  r = validate_config("[1,2]");
  expect(!r.ok, "non-object rejected");
  expect(jsonlite::validate_strict(config_validation_to_json(r)) == std::nullopt,
         "validation report is JSON");
}

void test_config_overlay() {
  EngineConfig c;
  std::string error;
  const bool ok = apply_config_json(
      R"({"config_version":"1","deny_modules":["foo"],"max_open_files":64,
          "default_timeout_seconds":999,"injected_env":{"A":"1"},"link_session_root":false})",
      c, &error);
  expect(ok, "overlay applied: " + error);
  expect(c.validation.deny_modules == std::vector<std::string>{"foo"}, "deny_modules replaced");
  expect(c.max_open_files == 64, "max_open_files set");
  expect(c.default_timeout_seconds == 300, "default timeout clamped");
  expect(c.injected_env.size() == 1 && c.injected_env["A"] == "1", "injected_env replaced");
  expect(!c.link_session_root, "bool applied");
  expect(c.output_cap_bytes == 200000, "absent keys untouched");

  EngineConfig d;
  expect(!apply_config_json(R"({"max_open_files":-1})", d, &error), "invalid overlay refused");
  expect(!error.empty(), "error message set");
  expect(d.max_open_files == 256, "config untouched on failure");
}

void test_config_from_env() {
  ::setenv("SCRIPTWARD_SANDBOX_DISABLED", "1", 1);
  ::setenv("SCRIPTWARD_FIXER_CMD", "fixer --fast", 1);
  ::setenv("SCRIPTWARD_MAX_OPEN_FILES", "77", 1);
  const EngineConfig c = EngineConfig::from_env();
  ::unsetenv("SCRIPTWARD_SANDBOX_DISABLED");
  ::unsetenv("SCRIPTWARD_FIXER_CMD");
  ::unsetenv("SCRIPTWARD_MAX_OPEN_FILES");
  expect(!c.sandbox_enabled, "sandbox disabled from env");
  expect(c.fixer_command == std::vector<std::string>({"fixer", "--fast"}), "fixer argv split");
  expect(c.max_open_files == 77, "max open files from env");
  expect(EngineConfig::from_env().sandbox_enabled, "enabled by default");
}

void test_find_executable() {
  expect(find_executable("/bin/sh") == "/bin/sh", "absolute path accepted");
  expect(!find_executable("sh").empty(), "sh found on PATH");
  expect(find_executable("/nonexistent/tool").empty(), "missing absolute path");
  expect(find_executable("").empty(), "empty name");
}

// ---------------------------------------------------------------------------
// Static Validator
// ---------------------------------------------------------------------------

void test_validator_accepts_and_collects_imports() {
  const auto v = default_validator();
  const auto r = v.validate(
      "import numpy as np\n"
      "from pandas.io import parsers\n"
      "import numpy.linalg, json\n"
      "from . import sibling\n"
      "def area(r):\n"
      "    return 3.14 * r * r\n"
      "print(area(2))\n");
  expect(r.ok && r.status == RunStatus::ok, "clean source accepted");
  expect(r.reasons.empty(), "no reasons");
  expect(r.imports == std::vector<std::string>({"json", "numpy", "pandas"}),
         "sorted, deduplicated roots");
}

void test_validator_blocks_imports() {
  const auto r = default_validator().validate("import subprocess\nimport os.path\nimport json\n");
  expect(!r.ok && r.status == RunStatus::blocked, "blocked");
  expect(r.reasons.size() == 1, "one combined reason");
  expect(r.reasons[0] == "imports not allowed: os, subprocess", "reason: " + r.reasons[0]);
  expect(r.imports.size() == 3, "imports still reported");
}

void test_validator_blocks_calls_and_paths() {
  const auto v = default_validator();
  auto r = v.validate("x = eval('1+1')\n");
  expect(r.status == RunStatus::blocked, "eval blocked");
  expect(r.reasons.size() == 1 && r.reasons[0] == "call not allowed: eval() (line 1)",
         "eval reason");

  r = v.validate("obj.eval(1)\n");
  expect(r.ok, "attribute call allowed");

  r = v.validate("f = open('/etc/passwd')\ng = open('../up.txt')\nh = open('data.csv')\n");
  expect(r.status == RunStatus::blocked && r.reasons.size() == 2, "two unsafe paths");
  expect(r.reasons[0] == "path not allowed in open(): /etc/passwd", r.reasons[0]);
  expect(r.reasons[1] == "path not allowed in open(): ../up.txt", r.reasons[1]);

  r = v.validate("with open('~/secret') as f:\n    pass\n");
  expect(r.status == RunStatus::blocked, "home path blocked");
}

void test_validator_fstring_fields() {
  const auto v = default_validator();
  auto r = v.validate("print(f\"{eval('1+1')}\")\n");
  expect(r.status == RunStatus::blocked, "eval in an f-string field blocked");
  expect(r.reasons.size() == 1 && r.reasons[0] == "call not allowed: eval() (line 1)",
         "field call reason");

  r = v.validate("x = f\"{__import__('os').getcwd()}\"\n");
  expect(r.status == RunStatus::blocked && r.reasons.size() == 1 &&
             r.reasons[0] == "call not allowed: __import__() (line 1)",
         "__import__ in a field blocked");

  r = v.validate("print(f\"{open('/etc/passwd').read()}\")\n");
  expect(r.reasons.size() == 1 && r.reasons[0] == "path not allowed in open(): /etc/passwd",
         "open() path in a field checked");

  r = v.validate("n = 1\ns = F\"\"\"\nvalue {n:{eval('3')}}\"\"\"\n");
  expect(r.reasons.size() == 1 && r.reasons[0] == "call not allowed: eval() (line 3)",
         "field nested in a format spec, positioned on its own line");

  r = v.validate("print(f\"{{eval('x')}}\")\ns = \"{eval('y')}\"\n");
  expect(r.ok, "doubled braces and plain strings are not fields");

  r = v.validate("x = 3\nprint(f\"{x!r:>10} {x=} {x:{x}} {len('ab')}\")\n");
  expect(r.ok, "conversions, debug markers and specs accepted");

  r = v.validate("s = f\"{}\"\n");
  expect(r.status == RunStatus::syntax_error && contains(r.reasons[0], "f-string: valid expression"),
         "empty field rejected");

  r = v.validate("s = f\"{x\"\n");
  expect(r.status == RunStatus::syntax_error && contains(r.reasons[0], "f-string: expecting '}'"),
         "unclosed field rejected");
}

void test_validator_grouped_callee() {
  const auto v = default_validator();
  auto r = v.validate("(eval)('1+1')\n");
  expect(r.status == RunStatus::blocked && r.reasons.size() == 1 &&
             r.reasons[0] == "call not allowed: eval() (line 1)",
         "parenthesized eval blocked");

  r = v.validate("data = ((open))('/etc/passwd')\n");
  expect(r.reasons.size() == 1 && r.reasons[0] == "path not allowed in open(): /etc/passwd",
         "parenthesized open path checked");

  r = v.validate("items = [(exec)('pass')]\nok = not (compile)('1', 'f', 'eval')\n");
  expect(r.reasons.size() == 2, "grouping after '[' and after a keyword");

  r = v.validate("print((len)('ab'))\nf = (print)\n");
  expect(r.ok, "allowed names and uncalled groups pass");
}

void test_validator_dangerous_patterns() {
  const auto v = default_validator();
  auto r = v.validate("cmd = 'RM  -RF /'\n");
  expect(r.status == RunStatus::blocked, "case-insensitive pattern");
  expect(r.reasons.size() == 1 && contains(r.reasons[0], "dangerous pattern detected: rm"),
         "pattern reason");

  r = v.validate("import os\nos.system('ls')\n");
  expect(r.reasons.size() == 2, "pattern and import both reported");
  expect(contains(r.reasons[0], "dangerous pattern"), "patterns come first");
  expect(r.reasons[1] == "imports not allowed: os", "imports second");

  r = v.validate("s = 'import os'\n");
  expect(r.ok && r.imports.empty(), "string contents are not imports");
}

void test_validator_patterns_on_huge_lines() {
  const auto v = default_validator();
  const std::string blanks(100000, ' ');
  auto r = v.validate("x = 'rm" + blanks + "-rf /'\n");
  expect(r.status == RunStatus::blocked && r.reasons.size() == 1 &&
             contains(r.reasons[0], "dangerous pattern detected: rm"),
         "long blank run still matches");

  r = v.validate("x = 'rm" + blanks + "'\n");
  expect(r.ok, "long blank run without the flag passes");

  r = v.validate("x = '" + std::string(200000, 'a') + "'\ny = 'subprocess.run'\n");
  expect(r.status == RunStatus::blocked, "match after a 200 KB line");

  r = v.validate("x = '" + std::string(1015, 'a') + " rm -rf'\n");
  expect(r.status == RunStatus::blocked, "match straddling a window boundary");
}

void test_validator_syntax_errors() {
  const auto v = default_validator();
  auto r = v.validate("print('hi'\n");
  expect(r.status == RunStatus::syntax_error, "unclosed paren");
  expect(contains(r.reasons[0], "was never closed"), r.reasons[0]);
  expect(contains(r.reasons[0], "(line 1:"), "position included");
  expect(r.imports.empty(), "imports empty on syntax error");

  r = v.validate("import os\nx = 'abc\n");
  expect(r.status == RunStatus::syntax_error, "unterminated string");
  expect(contains(r.reasons[0], "unterminated string literal"), r.reasons[0]);
  expect(r.imports.empty(), "no imports reported");

  r = v.validate("if True\n    pass\n");
  expect(r.status == RunStatus::syntax_error && contains(r.reasons[0], "expected ':'"),
         "missing colon");

  r = v.validate("def f():\nreturn 1\n");
  expect(r.status == RunStatus::syntax_error &&
             contains(r.reasons[0], "expected an indented block"),
         "missing block");

  r = v.validate("x = (1, 2]\n");
  expect(r.status == RunStatus::syntax_error, "mismatched bracket");

  r = v.validate("a b\n");
  expect(r.status == RunStatus::syntax_error && contains(r.reasons[0], "invalid syntax"),
         "adjacent operands");

  r = v.validate("x = 1\n$y = 2\n");
  expect(r.status == RunStatus::syntax_error && contains(r.reasons[0], "(line 2:"),
         "invalid character line");
}

void test_validator_rejects_bad_pattern() {
  ValidationPolicy p = ValidationPolicy::defaults();
  p.dangerous_patterns.push_back("([");
  bool threw = false;
  try {
    Validator v(p, std::make_shared<const PythonTokenParser>());
  } catch (const EngineError& e) {
    threw = e.code() == ErrorCode::config_invalid;
  }
  expect(threw, "bad pattern raises config_invalid");
}

void test_unsafe_literal_paths() {
  expect(is_unsafe_literal_path("/abs"), "absolute");
  expect(is_unsafe_literal_path("\\\\server\\share"), "UNC");
  expect(is_unsafe_literal_path("~/x"), "home");
  expect(is_unsafe_literal_path("a/../b"), "dotdot");
  expect(!is_unsafe_literal_path("out/plot.png"), "relative ok");
  expect(module_root("a.b.c") == "a", "module root");
}

// ---------------------------------------------------------------------------
// Dependency Resolver
// ---------------------------------------------------------------------------

void test_missing_dependencies_skips_denied() {
  const auto v = default_validator();
  FakeResolver resolver({"zzz_missing", "os"});
  const auto missing =
      find_missing_dependencies({"zzz_missing", "os", "json", "zzz_missing"}, v, resolver);
  expect(missing == std::vector<std::string>{"zzz_missing"}, "denied roots skipped");
}

void test_interpreter_resolver() {
  const std::string py = python();
  if (py.empty()) return skip("no python3");
  InterpreterModuleResolver resolver(py, shell_env(), 15);
  auto missing = resolver.unresolvable({"json", "scriptward_no_such_module_xyz", "math"});
  expect(missing == std::vector<std::string>{"scriptward_no_such_module_xyz"},
         "only the unknown module is missing");
  expect(resolver.unresolvable({}).empty(), "nothing to look up");
}

void test_resolver_spawn_failure() {
  InterpreterModuleResolver resolver("/nonexistent/python3", {}, 5);
  bool threw = false;
  try {
    resolver.unresolvable({"json"});
  } catch (const EngineError& e) {
    threw = e.code() == ErrorCode::spawn_failed;
  }
  expect(threw, "unspawnable lookup is an infrastructure failure");
}

// ---------------------------------------------------------------------------
// Sandbox Executor
// ---------------------------------------------------------------------------

ProcessSpec sh(const std::string& script) {
  ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", script};
  spec.env = shell_env();
  spec.timeout_ms = 10000;
  spec.max_output_bytes = 4096;
  return spec;
}

void test_process_capture() {
  const auto r = run_process(sh("echo hello; echo oops 1>&2; exit 3"));
  expect(r.spawned, "spawned");
  expect(r.exit_code == 3, "exit code kept");
  expect(r.stdout_text == "hello\n", "stdout: " + r.stdout_text);
  expect(r.stderr_text == "oops\n", "stderr: " + r.stderr_text);
  expect(!r.timed_out, "no timeout");
  expect(r.duration_ns > 0, "duration measured");
}

void test_process_timeout() {
  auto spec = sh("sleep 5");
  spec.timeout_ms = 300;
  const auto start = std::chrono::steady_clock::now();
  const auto r = run_process(spec);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(r.spawned && r.timed_out, "timed out");
  expect(r.exit_code == 124, "timeout exit code");
  expect(r.duration_ns >= 300ull * 1000 * 1000, "ran at least the timeout");
  expect(elapsed < std::chrono::seconds(3), "killed promptly");
}

void test_process_truncation() {
  auto spec = sh("i=0; while [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done");
  spec.max_output_bytes = 100;
  const auto r = run_process(spec);
  expect(r.stdout_text.size() == 100, "stdout capped");
  expect(r.stdout_truncated, "truncation flagged");
  expect(!r.stderr_truncated, "stderr not flagged");
}

void test_process_environment_and_cwd() {
  const fs::path dir = fresh_dir("cwd");
  auto spec = sh("echo \"$FOO\"; echo \"${HOME:-unset}\"; pwd");
  spec.env = {{"FOO", "bar"}, {"PATH", "/usr/bin:/bin"}};
  spec.cwd = dir.string();
  const auto r = run_process(spec);
  const std::string expected = "bar\nunset\n" + fs::canonical(dir).string() + "\n";
  expect(r.stdout_text == expected, "env and cwd: " + r.stdout_text);
  fs::remove_all(dir);
}

void test_process_spawn_failure() {
  ProcessSpec spec;
  spec.command = "/nonexistent/interpreter";
  const auto r = run_process(spec);
  expect(!r.spawned, "not spawned");
  expect(contains(r.error_message, "spawn_failed"), "error: " + r.error_message);
}

void test_rlimit_file_size() {
  const fs::path dir = fresh_dir("fsize");
  RlimitPolicy policy(ResourceLimits{5, 0, 1024, 0});
  auto spec = sh("head -c 8192 /dev/zero > big.bin");
  spec.cwd = dir.string();
  spec.policy = &policy;
  const auto r = run_process(spec);
  expect(r.spawned && r.exit_code != 0, "write past the limit fails");
  expect(fs::file_size(dir / "big.bin") <= 1024, "file capped at limit");
  fs::remove_all(dir);
}

void test_process_group_killed_after_exit() {
  const auto start = std::chrono::steady_clock::now();
  const auto r = run_process(sh("(sleep 30 &) ; echo done"));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(r.spawned && r.exit_code == 0, "leader exited cleanly");
  expect(r.stdout_text == "done\n", "output kept");
  expect(elapsed < std::chrono::seconds(10), "background descendant did not hold the run");
}

void test_sandbox_capabilities() {
  const auto caps = detect_platform_sandbox_capabilities();
  expect(caps.rlimits_cpu && caps.process_group_isolation, "posix capabilities");
  const auto unsupported = caps.unsupported();
  expect(std::find(unsupported.begin(), unsupported.end(), "network_isolation") !=
             unsupported.end(),
         "network isolation reported as unsupported");
}

// ---------------------------------------------------------------------------
// Workspace
// ---------------------------------------------------------------------------

void test_workspace_session_ids() {
  const fs::path base = fresh_dir("ws_ids");
  for (const std::string bad : {"", "../x", "a/b", "a\\b", ".."}) {
    bool threw = false;
    try {
      LocalWorkspace ws(base, bad);
    } catch (const EngineError& e) {
      threw = e.code() == ErrorCode::path_escape;
    }
    expect(threw, "session id rejected: '" + bad + "'");
  }
  LocalWorkspace ws(base, "session-1");
  expect(ws.root() == base / "session-1", "root under workspace dir");
  expect(fs::is_directory(ws.root()), "root created");
  fs::remove_all(base);
}

void test_workspace_safe_path() {
  const fs::path base = fresh_dir("ws_safe");
  LocalWorkspace ws(base, "s");
  const fs::path root = fs::weakly_canonical(ws.root());
  auto p = ws.safe_path("runs/abc/file.txt");
  expect(p && *p == root / "runs/abc/file.txt", "relative path resolved");
  expect(!ws.safe_path("../other"), "parent escape refused");
  expect(!ws.safe_path("a/../../other"), "nested escape refused");
  expect(!ws.safe_path("/etc/passwd"), "absolute refused");
  fs::create_directory_symlink(fs::temp_directory_path(), ws.root() / "link");
  expect(!ws.safe_path("link/x"), "symlink escape refused");
  expect(ws.safe_path("") == root, "empty path is the root");
  fs::remove_all(base);
}

// ---------------------------------------------------------------------------
// Artifact Tracker
// ---------------------------------------------------------------------------

void test_snapshot_diff() {
  const fs::path dir = fresh_dir("artifacts");
  write_text(dir / "source.py", "print(1)\n");
  write_text(dir / "keep.txt", "same");
  write_text(dir / "change.csv", "a,b\n");
  write_text(dir / "sub" / "source.py", "nested");
  const std::vector<std::string> excluded = {"source.py", "result.json", "attempts.jsonl"};
  const Snapshot before = take_snapshot(dir, excluded);
  expect(!before.contains("source.py"), "top-level source excluded");
  expect(before.contains("sub/source.py"), "nested file with same name tracked");

  write_text(dir / "change.csv", "a,b\n1,2\n");
  write_text(dir / "plots" / "fig.PNG", "png-bytes");
  write_text(dir / "result.json", "{}");
  fs::create_symlink(dir / "keep.txt", dir / "alias.txt");
  const Snapshot after = take_snapshot(dir, excluded);

  const auto changed = changed_paths(before, after);
  expect(changed == std::vector<std::string>({"change.csv", "plots/fig.PNG"}),
         "created and modified files only");

  const auto metas = describe_files(dir, changed);
  expect(metas.size() == 2, "both described");
  expect(metas[0].path == "change.csv" && metas[0].size_bytes == 8, "size of modified file");
  expect(metas[0].mime_type == "text/csv", "csv mime");
  expect(metas[1].mime_type == "image/png", "extension matched case-insensitively");
  expect(metas[1].modified_at.size() == 27, "modified_at formatted");
  fs::remove_all(dir);
}

void test_mime_table() {
  expect(mime_type_for("a.json") == "application/json", "json");
  expect(mime_type_for("report.xlsx") ==
             "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
         "xlsx");
  expect(mime_type_for("data.xml") == "text/xml", "xml");
  expect(mime_type_for("Makefile").empty(), "no extension");
  expect(mime_type_for("x.unknownext").empty(), "unknown extension");
}

// ---------------------------------------------------------------------------
// Fixers
// ---------------------------------------------------------------------------

void test_parse_error_detail() {
  const auto d = parse_error_detail(kNameErrorNp, 20000);
  expect(d.type == "NameError", "type: " + d.type);
  expect(d.message == "name 'np' is not defined", "message: " + d.message);
  expect(d.location && d.location->line == 1 && d.location->file == "/w/runs/r/source.py",
         "location parsed");
  expect(d.raw == std::string(kNameErrorNp).substr(0, std::string(kNameErrorNp).size() - 1),
         "raw is trimmed text");

  const auto empty = parse_error_detail("  \n", 20000);
  expect(empty.type.empty() && empty.message.empty() && !empty.location, "empty stderr");

  const auto plain = parse_error_detail("Killed\n", 20000);
  expect(plain.type.empty() && plain.raw == "Killed", "line without colon");

  const auto capped = parse_error_detail(std::string(100, 'x') + ": y", 10);
  expect(capped.raw.size() == 10, "raw capped");
}

void test_parse_error_detail_long_stderr() {
  const auto open_frame = parse_error_detail("File \"" + std::string(100000, 'a') + "\n", 20000);
  expect(!open_frame.location, "unterminated frame has no location");
  expect(open_frame.raw.size() == 20000, "raw capped");

  const std::string long_path = "/w/" + std::string(100000, 'p') + ".py";
  const auto framed = parse_error_detail(
      "Traceback (most recent call last):\n  File \"" + long_path +
          "\", line 7, in <module>\nValueError: bad\n",
      20000);
  expect(framed.location && framed.location->line == 7 && framed.location->file == long_path,
         "frame with a long path");
  expect(framed.type == "ValueError" && framed.message == "bad", "type and message");

  const auto decoy = parse_error_detail("  File \"a\" File \"b.py\", line 3\nE: x\n", 20000);
  expect(decoy.location && decoy.location->file == "b.py" && decoy.location->line == 3,
         "first well-formed frame on the line");
}

void test_prepend_import() {
  auto out = prepend_import("#!/usr/bin/env python3\n# header\n\nx = np.zeros(3)\n",
                            "import numpy as np");
  expect(out.has_value(), "inserted");
  expect(*out == "#!/usr/bin/env python3\n# header\n\nimport numpy as np\nx = np.zeros(3)\n",
         "inserted after shebang and comments: " + *out);

  out = prepend_import("x = 1", "import numpy as np");
  expect(out && *out == "import numpy as np\nx = 1", "no trailing newline preserved");

  expect(!prepend_import("import numpy as np\nx = np.ones(1)\n", "import numpy as np"),
         "already present");
  expect(!prepend_import("import numpy as np  # arrays\nprint(np.pi)\n", "import numpy as np"),
         "present with a trailing comment");
  expect(prepend_import("", "import pandas as pd") == "import pandas as pd\n", "empty source");
}

void test_strip_code_fences() {
  expect(strip_code_fences("```python\nprint(1)\n```") == "print(1)", "fenced with tag");
  expect(strip_code_fences("```\nprint(2)\n```\n") == "print(2)", "fenced without tag");
  expect(strip_code_fences("  print(3)\n") == "print(3)", "plain trimmed");
}

void test_heuristic_fixer() {
  HeuristicFixer fixer;
  ErrorDetail e;
  e.type = "NameError";
  e.message = "name 'plt' is not defined";
  auto fix = fixer.suggest(e, "plt.plot([1, 2])\n");
  expect(fix && fix->method == "heuristic_import_matplotlib", "matplotlib rule");
  expect(fix->source == "import matplotlib.pyplot as plt\nplt.plot([1, 2])\n", fix->source);

  e.message = "name 'pd' is not defined";
  fix = fixer.suggest(e, "import pandas as pd\ndf = pd.DataFrame()\n");
  expect(!fix, "rule does not match when the import is present");

  e.type = "TypeError";
  expect(!fixer.suggest(e, "x\n"), "other error types ignored");
}

void test_remote_fixer() {
  ErrorDetail e;
  expect(!RemoteFixer(nullptr).suggest(e, "x"), "absent client yields no fix");
  auto fix = RemoteFixer(std::make_shared<FakeRemoteClient>("print('fixed')\n")).suggest(e, "x");
  expect(fix && fix->method == "remote_fixer" && fix->source == "print('fixed')\n",
         "client answer used");
  expect(!RemoteFixer(std::make_shared<FakeRemoteClient>(std::nullopt)).suggest(e, "x"),
         "client without answer");
}

void test_command_fix_client() {
  const fs::path dir = fresh_dir("fixcmd");
  write_text(dir / "ok.sh",
             "test -f \"$1\" || exit 3\n"
             "grep -q '\"source\"' \"$1\" || exit 4\n"
             "printf '```python\\nprint(42)\\n```\\n'\n");
  write_text(dir / "fail.sh", "echo 'print(1)'\nexit 1\n");
  write_text(dir / "empty.sh", "exit 0\n");

  ErrorDetail e;
  e.type = "NameError";
  e.message = "name 'x' is not defined";
  CommandFixClient ok({"/bin/sh", (dir / "ok.sh").string()}, shell_env(), 10, 4096);
  const auto fixed = ok.suggest_fix(e, "print(x)\n");
  expect(fixed && *fixed == "print(42)", "fenced output stripped");

  CommandFixClient fail({"/bin/sh", (dir / "fail.sh").string()}, shell_env(), 10, 4096);
  expect(!fail.suggest_fix(e, "x"), "non-zero exit means no fix");
  CommandFixClient empty({"/bin/sh", (dir / "empty.sh").string()}, shell_env(), 10, 4096);
  expect(!empty.suggest_fix(e, "x"), "empty output means no fix");
  CommandFixClient missing({"/nonexistent/fixer"}, shell_env(), 10, 4096);
  expect(!missing.suggest_fix(e, "x"), "missing command means no fix");
  fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Auto-Correct Controller
// ---------------------------------------------------------------------------

void test_controller_ok_first_attempt() {
  const auto v = default_validator();
  FakeResolver resolver;
  ScriptedRunner runner({outcome(RunStatus::ok, "", {"out.txt"})});
  std::vector<Attempt> sunk;
  const auto out = run_controller(v, resolver, {std::make_shared<HeuristicFixer>()},
                                  "print('hi')\n", runner, 3, true, 30, &sunk);
  expect(out.status == RunStatus::ok, "ok");
  expect(out.attempts.size() == 1 && sunk.size() == 1, "one attempt, sunk once");
  expect(out.attempts[0].attempt == 1 && out.attempts[0].code_digest == code_digest("print('hi')\n"),
         "attempt recorded");
  expect(out.attempts[0].code_sha256 == sha256_hex("print('hi')\n"), "attempt sha256 recorded");
  expect(!out.attempts[0].autocorrect, "no autocorrect");
  expect(out.created_paths == std::vector<std::string>{"out.txt"}, "artifacts from ok attempt");
  expect(out.execution_time_seconds == 0.25, "time summed");
}

void test_controller_blocked_is_synthetic() {
  const auto v = default_validator();
  FakeResolver resolver;
  ScriptedRunner runner({outcome(RunStatus::ok)});
  std::vector<Attempt> sunk;
  const auto out = run_controller(v, resolver, {}, "import socket\n", runner, 3, true, 30, &sunk);
  expect(out.status == RunStatus::blocked, "blocked");
  expect(runner.sources.empty(), "nothing executed");
  expect(resolver.calls_ == 0, "resolver not consulted");
  expect(out.attempts.size() == 1 && sunk.size() == 1, "one synthetic attempt");
  expect(out.attempts[0].status == RunStatus::blocked, "attempt status");
  expect(out.attempts[0].stderr_text == "imports not allowed: socket", out.attempts[0].stderr_text);
  expect(out.attempts[0].execution_time_seconds == 0.0, "zero time");
  expect(out.execution_time_seconds == 0.0, "run time zero");
  expect(out.stderr_text == "imports not allowed: socket", "run stderr carries reasons");
}

void test_controller_syntax_error() {
  const auto v = default_validator();
  FakeResolver resolver;
  ScriptedRunner runner({outcome(RunStatus::ok)});
  const auto out = run_controller(v, resolver, {}, "def broken(:\n", runner);
  expect(out.status == RunStatus::syntax_error, "syntax_error");
  expect(runner.sources.empty(), "nothing executed");
  expect(out.validation.imports.empty(), "imports empty");
  expect(out.attempts.size() == 1 && out.attempts[0].error.type == "SyntaxError",
         "synthetic attempt typed");
}

void test_controller_deps_missing() {
  const auto v = default_validator();
  FakeResolver resolver({"numpy", "scipy"});
  ScriptedRunner runner({outcome(RunStatus::ok)});
  const auto out =
      run_controller(v, resolver, {}, "import scipy\nimport numpy\nimport json\n", runner);
  expect(out.status == RunStatus::deps_missing, "deps_missing");
  expect(out.missing_dependencies == std::vector<std::string>({"numpy", "scipy"}),
         "sorted missing list");
  expect(runner.sources.empty(), "no process spawned");
  expect(out.stderr_text == "missing dependencies: numpy, scipy", out.stderr_text);
  expect(out.attempts.size() == 1 && out.attempts[0].status == RunStatus::deps_missing,
         "synthetic attempt");
}

void test_controller_heuristic_retry() {
  const auto v = default_validator();
  FakeResolver resolver;
  ScriptedRunner runner({outcome(RunStatus::error, kNameErrorNp), outcome(RunStatus::ok)});
  const std::string src = "x = np.zeros(3)\nprint(x)\n";
  const auto out = run_controller(
      v, resolver,
      {std::make_shared<HeuristicFixer>(), std::make_shared<RemoteFixer>(nullptr)}, src, runner);
  expect(out.status == RunStatus::ok, "fixed run succeeds");
  expect(out.attempts.size() == 2, "two attempts");
  const auto& first = out.attempts[0];
  expect(first.status == RunStatus::error && first.autocorrect && first.autocorrect->applied,
         "fix applied on the failing attempt");
  expect(first.autocorrect->method == "heuristic_import_numpy", "method named");
  expect(first.error.type == "NameError", "error parsed");
  expect(runner.sources.size() == 2, "executed twice");
  const std::string& second = runner.sources[1];
  size_t count = 0;
  for (size_t pos = second.find("import numpy as np"); pos != std::string::npos;
       pos = second.find("import numpy as np", pos + 1)) {
    ++count;
  }
  expect(count == 1, "exactly one injected import");
  expect(out.attempts[1].attempt == 2 && !out.attempts[1].autocorrect, "second attempt");
  expect(out.execution_time_seconds == 0.5, "time summed across attempts");
  expect(out.validation.imports == std::vector<std::string>{"numpy"},
         "validation is the last one computed");
}

void test_controller_timeout_not_retried() {
  const auto v = default_validator();
  FakeResolver resolver;
  auto fixer = std::make_shared<CountingFixer>();
  ScriptedRunner runner({outcome(RunStatus::timeout)});
  const auto out = run_controller(v, resolver, {fixer}, "while True:\n    pass\n", runner);
  expect(out.status == RunStatus::timeout, "timeout");
  expect(out.attempts.size() == 1, "never retried");
  expect(fixer->count_ == 0, "fixer not consulted");
}

void test_controller_budget_exhaustion() {
  const auto v = default_validator();
  FakeResolver resolver;
  auto fixer = std::make_shared<CountingFixer>();
  ScriptedRunner runner({outcome(RunStatus::error, "NameError: name 'foo' is not defined")});
  std::vector<Attempt> sunk;
  const auto out = run_controller(v, resolver, {fixer}, "foo()\n", runner, 10, true, 30, &sunk);
  expect(out.status == RunStatus::error, "last status kept");
  expect(out.attempts.size() == 3 && sunk.size() == 3, "budget clamped to 3");
  for (int i = 0; i < 3; ++i) expect(out.attempts[i].attempt == i + 1, "contiguous numbering");
  expect(out.attempts[0].autocorrect && out.attempts[1].autocorrect, "fixes recorded");
  expect(!out.attempts[2].autocorrect, "no fix after budget is spent");
  expect(fixer->count_ == 2, "fixer consulted between attempts only");
}

void test_controller_rejected_fix() {
  const auto v = default_validator();
  FakeResolver resolver;
  ScriptedRunner runner({outcome(RunStatus::error, "ValueError: bad")});
  const auto out =
      run_controller(v, resolver, {std::make_shared<FixedFixer>("import os\n", "remote_fixer")},
                     "raise ValueError('bad')\n", runner);
  expect(out.status == RunStatus::error, "run ends with the error");
  expect(out.attempts.size() == 1 && runner.sources.size() == 1, "no extra execution");
  const auto& ac = out.attempts[0].autocorrect;
  expect(ac && !ac->applied && ac->method == "remote_fixer", "rejection recorded");
  expect(contains(ac->rejected_reason, "imports not allowed: os"), ac->rejected_reason);
  expect(out.validation.status == RunStatus::blocked, "validation of the proposal kept");
}

void test_controller_fix_with_missing_dependency() {
  const auto v = default_validator();
  FakeResolver resolver({"numpy"});
  ScriptedRunner runner({outcome(RunStatus::error, kNameErrorNp)});
  const auto out = run_controller(v, resolver, {std::make_shared<HeuristicFixer>()},
                                  "print(np.pi)\n", runner);
  expect(out.status == RunStatus::error, "status stays error");
  const auto& ac = out.attempts[0].autocorrect;
  expect(ac && !ac->applied && contains(ac->rejected_reason, "numpy"), "deps rejection recorded");
  expect(out.missing_dependencies.empty(), "not a deps_missing run");
}

void test_controller_no_fix_paths() {
  const auto v = default_validator();
  FakeResolver resolver;
  {
    ScriptedRunner runner({outcome(RunStatus::error, "ValueError: x")});
    const auto out = run_controller(v, resolver, {std::make_shared<CountingFixer>()},
                                    "raise ValueError('x')\n", runner, 3, false);
    expect(out.attempts.size() == 1, "auto-correct disabled");
  }
  {
    ScriptedRunner runner({outcome(RunStatus::error, "ValueError: x")});
    const auto out = run_controller(v, resolver, {std::make_shared<EchoFixer>()},
                                    "raise ValueError('x')\n", runner);
    expect(out.attempts.size() == 1 && !out.attempts[0].autocorrect,
           "unchanged proposal is not a fix");
  }
  {
    ScriptedRunner runner({outcome(RunStatus::error, "ValueError: x")});
    const auto out = run_controller(v, resolver, {}, "raise ValueError('x')\n", runner, 1);
    expect(out.attempts.size() == 1, "single attempt budget");
  }
}

void test_controller_clamps_timeout() {
  const auto v = default_validator();
  FakeResolver resolver;
  ScriptedRunner low({outcome(RunStatus::ok)});
  run_controller(v, resolver, {}, "pass\n", low, 3, true, 0);
  expect(low.timeouts == std::vector<int>{1}, "timeout 0 runs as 1");
  ScriptedRunner high({outcome(RunStatus::ok)});
  run_controller(v, resolver, {}, "pass\n", high, 3, true, 1000);
  expect(high.timeouts == std::vector<int>{300}, "timeout capped at 300");
}

// ---------------------------------------------------------------------------
// Run Ledger
// ---------------------------------------------------------------------------

void test_run_id_format() {
  const std::string id = make_run_id();
  expect(id.size() == 34, "run id length: " + id);
  expect(id[8] == 'T' && id[21] == '-', "run id layout: " + id);
  expect(make_run_id() != id, "unique");
}

void test_ledger_files() {
  const fs::path root = fresh_dir("ledger_files");
  RunLedger ledger(root);
  const fs::path dir = ledger.create_run_dir("r1");
  expect(dir == root / "runs" / "r1" && fs::is_directory(dir), "run dir created");
  bool threw = false;
  try {
    ledger.create_run_dir("r1");
  } catch (const EngineError& e) {
    threw = e.code() == ErrorCode::io_failed;
  }
  expect(threw, "existing run dir refused");

  Attempt a;
  a.code_digest = code_digest("x");
  ledger.append_attempt(dir, a);
  a.attempt = 2;
  ledger.append_attempt(dir, a);
  expect(read_lines(dir / "attempts.jsonl").size() == 2, "attempts appended");

  Run run;
  run.run_id = "r1";
  run.session_id = "s";
  run.started_at = utc_now_iso();
  run.status = RunStatus::ok;
  ledger.write_result(dir, run);
  expect(!fs::exists(dir / "result.json.tmp"), "temporary removed");
  const std::string result = read_text(dir / "result.json");
  expect(contains(result, "\"run_id\":\"r1\""), "result written");
  fs::remove_all(root);
}

void test_list_runs_order_and_limit() {
  const fs::path root = fresh_dir("ledger_list");
  RunLedger ledger(root);
  fs::create_directories(ledger.runs_dir());
  {
    std::ofstream idx(ledger.index_path());
    idx << R"({"run_id":"c","started_at":"2026-01-03T00:00:00.000000Z","status":"ok","execution_time_seconds":1.0,"created_files":[]})" << "\n";
    idx << "this line is garbage\n";
    idx << R"({"run_id":"a","started_at":"2026-01-01T00:00:00.000000Z","status":"error","execution_time_seconds":0.5,"created_files":[]})" << "\n";
    idx << "\n";
    idx << R"({"run_id":"d","started_at":"2026-01-04T00:00:00.000000Z","status":"timeout","execution_time_seconds":2.0,"created_files":["x.png"]})" << "\n";
    idx << R"({"run_id":"b","started_at":"2026-01-02T00:00:00.000000Z","status":"blocked","execution_time_seconds":0.0,"created_files":[]})" << "\n";
  }
  auto list = ledger.list_runs("s", 2);
  expect(list.session_id == "s", "session echoed");
  expect(list.items.size() == 2, "limit honoured");
  expect(list.items[0].run_id == "c" && list.items[1].run_id == "d", "most recent, ascending");

  list = ledger.list_runs("s", 0);
  expect(list.items.size() == 1 && list.items[0].run_id == "d", "limit clamped to 1");

  list = ledger.list_runs("s", 1000);
  expect(list.items.size() == 4, "malformed lines skipped");
  expect(list.items[0].run_id == "a", "ascending order");

  RunLedger empty(fresh_dir("ledger_empty"));
  expect(empty.list_runs("s", 10).items.empty(), "missing index is empty");
  fs::remove_all(root);
  fs::remove_all(fs::temp_directory_path() / ("scriptward_ledger_empty_" + std::to_string(::getpid())));
}

void test_index_concurrent_appends() {
  const fs::path root = fresh_dir("ledger_concurrent");
  RunLedger ledger(root);
  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&ledger, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        RunSummary s;
        s.run_id = "t" + std::to_string(t) + "-" + std::to_string(i);
        s.started_at = utc_now_iso();
        s.status = RunStatus::ok;
        s.created_files = {std::string(200, 'f')};
        ledger.append_index(s);
      }
    });
  }
  for (auto& th : threads) th.join();
  const auto lines = read_lines(ledger.index_path());
  expect(lines.size() == kThreads * kPerThread, "every line written");
  for (const auto& line : lines) expect(parse_run_summary(line).has_value(), "no torn line");
  expect(ledger.list_runs("s", 200).items.size() == 200, "all listed");
  fs::remove_all(root);
}

// ---------------------------------------------------------------------------
// Retention
// ---------------------------------------------------------------------------

void set_age_hours(const fs::path& p, int hours) {
  fs::last_write_time(p, fs::file_time_type::clock::now() - std::chrono::hours(hours));
}

void test_retention_age() {
  const fs::path root = fresh_dir("retention_age");
  RunLedger ledger(root);
  write_text(ledger.runs_dir() / "old" / "a.txt", "a");
  write_text(ledger.runs_dir() / "old" / "nested" / "b.txt", "b");
  write_text(ledger.runs_dir() / "fresh" / "c.txt", "c");
  write_text(ledger.runs_dir() / ".hidden" / "d.txt", "d");
  write_text(ledger.runs_dir() / "__pycache__" / "e.pyc", "e");
  write_text(ledger.index_path(), "{}\n");
  set_age_hours(ledger.runs_dir() / "old", 48);
  set_age_hours(ledger.runs_dir() / ".hidden", 48);
  set_age_hours(ledger.runs_dir() / "__pycache__", 48);

  const auto report = cleanup_runs(ledger, "s", 24, false);
  expect(report.session_id == "s", "session echoed");
  expect(report.removed_runs == 1 && report.removed_files == 2, "only the old run removed");
  expect(!fs::exists(ledger.runs_dir() / "old"), "old gone");
  expect(fs::exists(ledger.runs_dir() / "fresh"), "fresh kept");
  expect(fs::exists(ledger.runs_dir() / ".hidden"), "hidden kept");
  expect(fs::exists(ledger.runs_dir() / "__pycache__"), "__pycache__ kept");
  expect(read_text(ledger.index_path()) == "{}\n", "index untouched in age mode");
  fs::remove_all(root);
}

void test_retention_remove_all() {
  const fs::path root = fresh_dir("retention_all");
  RunLedger ledger(root);
  write_text(ledger.runs_dir() / "r1" / "a.txt", "a");
  write_text(ledger.runs_dir() / "r1" / "deep" / "er" / "c.txt", "c");
  write_text(ledger.runs_dir() / "r2" / "b.txt", "b");
  write_text(root / "outside.txt", "o");
  fs::create_directory_symlink(root, ledger.runs_dir() / "r2" / "session");
  fs::create_symlink(root / "outside.txt", ledger.runs_dir() / "r1" / "deep" / "link.txt");
  write_text(ledger.index_path(), "{\"run_id\":\"r1\"}\n");

  const auto report = cleanup_runs(ledger, "s", 24, true);
  expect(report.removed_runs == 2, "all runs removed");
  expect(report.removed_files == 3, "symlinks not counted or followed");
  expect(read_text(root / "outside.txt") == "o", "symlink target untouched");
  expect(fs::exists(ledger.index_path()) && fs::file_size(ledger.index_path()) == 0,
         "index emptied");
  expect(fs::exists(root), "session root survives the session link");

  RunLedger missing(root / "nowhere");
  const auto none = cleanup_runs(missing, "s", 24, true);
  expect(none.removed_runs == 0 && none.removed_files == 0, "missing runs dir is a no-op");
  fs::remove_all(root);
}

void test_retention_sweep_skips_unremovable() {
  if (::geteuid() == 0) return skip("directory permissions do not bind root");
  const fs::path root = fresh_dir("retention_partial");
  RunLedger ledger(root);
  const fs::path run = ledger.runs_dir() / "r1";
  write_text(run / "a.txt", "a");
  write_text(run / "locked" / "b.txt", "b");
  write_text(run / "z.txt", "z");
  fs::permissions(run / "locked", fs::perms::owner_read | fs::perms::owner_exec,
                  fs::perm_options::replace);

  const auto report = cleanup_runs(ledger, "s", 24, true);
  expect(report.removed_runs == 0 && report.removed_files == 0, "partial removal not counted");
  expect(!fs::exists(run / "a.txt") && !fs::exists(run / "z.txt"),
         "entries beside the stuck one removed");
  expect(fs::exists(run / "locked" / "b.txt"), "entry in the read-only directory stays");

  fs::permissions(run / "locked", fs::perms::owner_all, fs::perm_options::replace);
  fs::remove_all(root);
}

// ---------------------------------------------------------------------------
// Observability
// ---------------------------------------------------------------------------

void test_latency_histogram() {
  LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 99; ++i) h.record(1000ull * 1000);  // 1ms
  h.record(1000ull * 1000 * 1000);                        // 1s
  expect(h.count() == 100, "count");
  expect(h.percentile(0.5) < 2000.0, "p50 near 1ms");
  expect(h.percentile(1.0) > 500000.0, "p100 near 1s");
  expect(jsonlite::validate_strict(h.to_json()) == std::nullopt, "histogram JSON");
}

void test_engine_stats() {
  EngineStats stats;
  RunEvent ev;
  ev.run_id = "r";
  ev.status = RunStatus::blocked;
  ev.attempts = 1;
  stats.record_run(ev);
  ev.status = RunStatus::ok;
  ev.attempts = 2;
  ev.autocorrect_applied = true;
  stats.record_run(ev);
  stats.record_failure(ErrorCode::spawn_failed);
  expect(stats.total_runs.load() == 2 && stats.runs_ok.load() == 1 && stats.runs_blocked.load() == 1,
         "status counters");
  expect(stats.attempts_total.load() == 3 && stats.autocorrect_applied.load() == 1,
         "attempt counters");
  const std::string json = stats.to_json();
  expect(jsonlite::validate_strict(json) == std::nullopt, "stats JSON");
  expect(contains(json, "\"spawn_failed\":1"), "failure category counted");

  for (size_t i = 0; i < EngineStats::kMaxRecentEvents + 5; ++i) {
    ev.run_id = std::to_string(i);
    stats.record_run(ev);
  }
  const auto recent = stats.recent_events_snapshot();
  expect(recent.size() == EngineStats::kMaxRecentEvents, "ring bounded");
  expect(recent.back().run_id == std::to_string(EngineStats::kMaxRecentEvents + 4),
         "newest last");
}

std::atomic<int> g_hook_calls{0};
void counting_hook(const RunEvent&) { g_hook_calls++; }

void test_event_log_publisher() {
  const fs::path dir = fresh_dir("artifact_log");
  EventLogArtifactPublisher pub((dir / "artifacts.jsonl").string());
  ArtifactEvent ev;
  ev.session_id = "s";
  ev.run_id = "r";
  ev.path = "a.png";
  ev.meta.path = "a.png";
  ev.meta.mime_type = "image/png";
  pub.publish(ev);
  pub.publish(ev);
  const auto lines = read_lines(dir / "artifacts.jsonl");
  expect(lines.size() == 2, "two events logged");
  expect(jsonlite::validate_strict(lines[0]) == std::nullopt && contains(lines[0], "\"op\":\"write\""),
         "event line shape");

  EventLogArtifactPublisher broken((dir / "missing" / "x.jsonl").string());
  bool threw = false;
  try {
    broken.publish(ev);
  } catch (const EngineError& e) {
    threw = e.code() == ErrorCode::publisher_failed;
  }
  expect(threw, "unwritable log reports publisher_failed");

  int hooked = 0;
  EventLogArtifactPublisher hooked_pub("", [&hooked](const ArtifactEvent&) { ++hooked; });
  hooked_pub.publish(ev);
  expect(hooked == 1, "hook receives events");
  fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

void test_engine_blocked_run_persisted() {
  const fs::path ws = fresh_dir("engine_blocked");
  EngineConfig config = test_config(ws);
  config.interpreter = "/nonexistent/python3";  // proves nothing is spawned
  const Engine engine(config);

  ExecuteRequest req;
  req.session_id = "alpha";
  req.source = "import os\nprint(os.getcwd())\n";
  const Run run = engine.execute(req);
  expect(run.status == RunStatus::blocked, "blocked");
  expect(run.attempts.size() == 1 && run.execution_time_seconds == 0.0, "synthetic attempt");
  expect(contains(run.stderr_text, "imports not allowed: os"), run.stderr_text);

  const fs::path run_dir = ws / "alpha" / "runs" / run.run_id;
  expect(read_text(run_dir / "source.py") == req.source, "source persisted");
  expect(read_lines(run_dir / "attempts.jsonl").size() == 1, "synthetic attempt appended");
  std::optional<jsonlite::JsonError> err;
  const auto result = jsonlite::parse(read_text(run_dir / "result.json"), &err);
  expect(!err && jsonlite::get_string(result, "status") == "blocked", "result.json written");
  expect(fs::is_symlink(run_dir / "session"), "session link created");

  const auto list = engine.list_runs("alpha", 10);
  expect(list.items.size() == 1 && list.items[0].run_id == run.run_id, "indexed");

  const auto report = engine.cleanup("alpha", 24, true);
  expect(report.removed_runs == 1, "cleanup removes the run");
  expect(engine.list_runs("alpha", 10).items.empty(), "index emptied");
  fs::remove_all(ws);
}

void test_engine_rejects_bad_session() {
  const fs::path ws = fresh_dir("engine_session");
  const Engine engine(test_config(ws));
  ExecuteRequest req;
  req.session_id = "../escape";
  req.source = "pass\n";
  bool threw = false;
  try {
    engine.execute(req);
  } catch (const EngineError& e) {
    threw = e.code() == ErrorCode::path_escape;
  }
  expect(threw, "path_escape raised");
  fs::remove_all(ws);
}

void test_engine_resolves_paths_through_workspace() {
  const fs::path ws = fresh_dir("engine_refusing");
  EngineConfig config = test_config(ws);
  config.interpreter = "/nonexistent/python3";
  EngineCollaborators collab;
  collab.resolver = std::make_shared<FakeResolver>();
  collab.workspace_factory = [ws](const std::string& session) -> std::unique_ptr<Workspace> {
    return std::make_unique<RefusingWorkspace>(ws / session);
  };
  const Engine engine(config, collab);

  ExecuteRequest req;
  req.session_id = "alpha";
  req.source = "print(1)\n";
  ErrorCode code = ErrorCode::none;
  try {
    engine.execute(req);
  } catch (const EngineError& e) {
    code = e.code();
  }
  expect(code == ErrorCode::path_escape, "execute refused: " + to_string(code));
  expect(!fs::exists(ws / "alpha" / "runs"), "no run directory created");

  code = ErrorCode::none;
  try {
    engine.list_runs("alpha", 10);
  } catch (const EngineError& e) {
    code = e.code();
  }
  expect(code == ErrorCode::path_escape, "list_runs refused");
  fs::remove_all(ws);
}

void test_engine_with_shell_interpreter() {
  const fs::path ws = fresh_dir("engine_sh");
  EngineConfig config = test_config(ws);
  config.interpreter = "/bin/sh";
  config.interpreter_args.clear();
  EngineCollaborators collab;
  collab.resolver = std::make_shared<FakeResolver>();
  const Engine engine(config, collab);

  ExecuteRequest req;
  req.session_id = "sh";
  req.source = "true\n";
  Run run = engine.execute(req);
  expect(run.status == RunStatus::ok, "exit 0 is ok");
  expect(run.attempts.size() == 1, "one attempt");

  req.source = "false\n";
  run = engine.execute(req);
  expect(run.status == RunStatus::error, "non-zero exit is error");
  expect(run.attempts.size() == 1, "no fixer proposal, no retry");

  expect(engine.list_runs("sh", 50).items.size() == 2, "both runs indexed");
  fs::remove_all(ws);
}

void test_engine_spawn_failure_raises() {
  const fs::path ws = fresh_dir("engine_spawn");
  EngineConfig config = test_config(ws);
  config.interpreter = "/nonexistent/python3";
  EngineCollaborators collab;
  collab.resolver = std::make_shared<FakeResolver>();
  const Engine engine(config, collab);
  ExecuteRequest req;
  req.session_id = "s";
  req.source = "print(1)\n";
  bool threw = false;
  try {
    engine.execute(req);
  } catch (const EngineError& e) {
    threw = e.code() == ErrorCode::spawn_failed;
  }
  expect(threw, "spawn failure is an EngineError");
  fs::remove_all(ws);
}

void test_engine_python_ok_with_artifacts() {
  if (python().empty()) return skip("no python3");
  const fs::path ws = fresh_dir("engine_py_ok");
  auto publisher = std::make_shared<RecordingPublisher>();
  EngineCollaborators collab;
  collab.publisher = publisher;
  const Engine engine(test_config(ws), collab);
  set_run_event_hook(counting_hook);
  const int hooks_before = g_hook_calls.load();

  ExecuteRequest req;
  req.session_id = "py";
  req.source =
      "with open('out.txt', 'w') as f:\n"
      "    f.write('hello')\n"
      "print('done')\n";
  const Run run = engine.execute(req);
  set_run_event_hook(nullptr);

  expect(run.status == RunStatus::ok, "ok: " + run.stderr_text);
  expect(run.stdout_text == "done\n", "stdout: " + run.stdout_text);
  expect(run.attempts.size() == 1, "one attempt");
  expect(run.created_files.size() == 1, "one artifact");
  expect(run.created_files[0].path == "out.txt" && run.created_files[0].size_bytes == 5,
         "artifact metadata");
  expect(run.created_files[0].mime_type == "text/plain", "artifact mime");
  expect(publisher->events.size() == 1 && publisher->events[0].path == "out.txt",
         "artifact published");
  expect(g_hook_calls.load() == hooks_before + 1, "run event emitted once");
  fs::remove_all(ws);
}

void test_engine_python_error_detail() {
  if (python().empty()) return skip("no python3");
  const fs::path ws = fresh_dir("engine_py_err");
  const Engine engine(test_config(ws));
  ExecuteRequest req;
  req.session_id = "py";
  req.source = "raise ValueError('boom')\n";
  const Run run = engine.execute(req);
  expect(run.status == RunStatus::error, "error");
  expect(run.attempts.size() == 1, "no fix available");
  expect(run.attempts[0].error.type == "ValueError" && run.attempts[0].error.message == "boom",
         "error parsed");
  expect(run.attempts[0].error.location && run.attempts[0].error.location->line == 1,
         "location parsed");
  fs::remove_all(ws);
}

void test_engine_python_timeout() {
  if (python().empty()) return skip("no python3");
  const fs::path ws = fresh_dir("engine_py_timeout");
  const Engine engine(test_config(ws));
  ExecuteRequest req;
  req.session_id = "py";
  req.source = "import time\ntime.sleep(10)\n";
  req.timeout_seconds = 1;
  const Run run = engine.execute(req);
  expect(run.status == RunStatus::timeout, "timeout");
  expect(run.attempts.size() == 1, "timeout never retried");
  expect(run.execution_time_seconds >= 1.0 && run.execution_time_seconds < 5.0,
         "bounded elapsed time");
  fs::remove_all(ws);
}

void test_engine_python_deps_missing() {
  if (python().empty()) return skip("no python3");
  const fs::path ws = fresh_dir("engine_py_deps");
  const Engine engine(test_config(ws));
  ExecuteRequest req;
  req.session_id = "py";
  req.source = "import scriptward_missing_pkg\nimport json\n";
  const Run run = engine.execute(req);
  expect(run.status == RunStatus::deps_missing, "deps_missing");
  expect(run.missing_dependencies == std::vector<std::string>{"scriptward_missing_pkg"},
         "missing list");
  expect(run.execution_time_seconds == 0.0, "nothing executed");
  fs::remove_all(ws);
}

void test_engine_python_heuristic() {
  if (python().empty()) return skip("no python3");
  const fs::path ws = fresh_dir("engine_py_heur");
  const Engine engine(test_config(ws));
  ExecuteRequest req;
  req.session_id = "py";
  req.source = "print(np.pi > 3)\n";
  const Run run = engine.execute(req);
  expect(!run.attempts.empty() && run.attempts[0].autocorrect.has_value(), "fix attempted");
  const auto& ac = *run.attempts[0].autocorrect;
  expect(ac.method == "heuristic_import_numpy", "heuristic method");
  if (ac.applied) {
    expect(run.attempts.size() == 2 && run.status == RunStatus::ok, "numpy present: fixed run ok");
    expect(run.stdout_text == "True\n", "fixed output");
  } else {
    expect(run.attempts.size() == 1 && run.status == RunStatus::error, "numpy absent: rejected");
    expect(contains(ac.rejected_reason, "numpy"), ac.rejected_reason);
  }
  fs::remove_all(ws);
}

void test_engine_python_artifacts_not_double_counted() {
  if (python().empty()) return skip("no python3");
  const fs::path ws = fresh_dir("engine_py_diff");
  EngineCollaborators collab;
  collab.fixers = {std::make_shared<FixedFixer>(
      "with open('b.txt', 'w') as f:\n    f.write('yy')\n", "test_fixer")};
  const Engine engine(test_config(ws), collab);
  ExecuteRequest req;
  req.session_id = "py";
  req.source =
      "with open('a.txt', 'w') as f:\n"
      "    f.write('x')\n"
      "raise RuntimeError('first attempt fails')\n";
  const Run run = engine.execute(req);
  expect(run.status == RunStatus::ok, "second attempt ok: " + run.stderr_text);
  expect(run.attempts.size() == 2, "two attempts");
  expect(run.created_files.size() == 1 && run.created_files[0].path == "b.txt",
         "only files from the successful attempt");
  expect(run.created_files[0].size_bytes == 2, "size of b.txt");
  fs::remove_all(ws);
}

void test_engine_publisher_failure_counted() {
  if (python().empty()) return skip("no python3");
  const fs::path ws = fresh_dir("engine_py_pub");
  EngineCollaborators collab;
  collab.publisher = std::make_shared<ThrowingPublisher>();
  const Engine engine(test_config(ws), collab);
  const auto before = global_engine_stats().publisher_failures.load();
  ExecuteRequest req;
  req.session_id = "py";
  req.source = "open('x.csv', 'w').write('a,b\\n')\n";
  const Run run = engine.execute(req);
  expect(run.status == RunStatus::ok, "run unaffected by publisher");
  expect(global_engine_stats().publisher_failures.load() == before + 1, "failure counted");
  fs::remove_all(ws);
}

}  // namespace

int main() {
  std::cout << "=== scriptward Test Suite ===\n";

  std::cout << "\n[Hashing & Types]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("code digest domain", test_code_digest_domain);
  run_test("sha256 known vectors", test_sha256_known_vectors);
  run_test("version manifest", test_version_manifest);
  run_test("status round trip", test_status_round_trip);
  run_test("UTC ISO format", test_utc_iso_format);
  run_test("UTF-8 helpers", test_utf8_helpers);
  run_test("run JSON shape", test_run_json_shape);
  run_test("run summary parse", test_run_summary_parse);

  std::cout << "\n[Configuration]\n";
  run_test("clamps", test_clamps);
  run_test("config validation", test_config_validation);
  run_test("config overlay", test_config_overlay);
  run_test("config from env", test_config_from_env);
  run_test("find executable", test_find_executable);

  std::cout << "\n[Static Validator]\n";
  run_test("accepts and collects imports", test_validator_accepts_and_collects_imports);
  run_test("blocks imports", test_validator_blocks_imports);
  run_test("blocks calls and paths", test_validator_blocks_calls_and_paths);
  run_test("f-string fields", test_validator_fstring_fields);
  run_test("grouped callee", test_validator_grouped_callee);
  run_test("dangerous patterns", test_validator_dangerous_patterns);
  run_test("patterns on huge lines", test_validator_patterns_on_huge_lines);
  run_test("syntax errors", test_validator_syntax_errors);
  run_test("bad pattern rejected", test_validator_rejects_bad_pattern);
  run_test("unsafe literal paths", test_unsafe_literal_paths);

  std::cout << "\n[Dependency Resolver]\n";
  run_test("denied roots skipped", test_missing_dependencies_skips_denied);
  run_test("interpreter resolver", test_interpreter_resolver);
  run_test("resolver spawn failure", test_resolver_spawn_failure);

  std::cout << "\n[Sandbox Executor]\n";
  run_test("stdout/stderr/exit capture", test_process_capture);
  run_test("timeout enforcement", test_process_timeout);
  run_test("output truncation", test_process_truncation);
  run_test("environment and cwd", test_process_environment_and_cwd);
  run_test("spawn failure", test_process_spawn_failure);
  run_test("RLIMIT_FSIZE", test_rlimit_file_size);
  run_test("process group killed after exit", test_process_group_killed_after_exit);
  run_test("capability report", test_sandbox_capabilities);

  std::cout << "\n[Workspace]\n";
  run_test("session id validation", test_workspace_session_ids);
  run_test("safe_path confinement", test_workspace_safe_path);

  std::cout << "\n[Artifact Tracker]\n";
  run_test("snapshot diff", test_snapshot_diff);
  run_test("mime table", test_mime_table);

  std::cout << "\n[Fixers]\n";
  run_test("parse error detail", test_parse_error_detail);
  run_test("parse error detail long stderr", test_parse_error_detail_long_stderr);
  run_test("prepend import", test_prepend_import);
  run_test("strip code fences", test_strip_code_fences);
  run_test("heuristic fixer", test_heuristic_fixer);
  run_test("remote fixer", test_remote_fixer);
  run_test("command fix client", test_command_fix_client);

  std::cout << "\n[Auto-Correct Controller]\n";
  run_test("ok on first attempt", test_controller_ok_first_attempt);
  run_test("blocked is synthetic", test_controller_blocked_is_synthetic);
  run_test("syntax error", test_controller_syntax_error);
  run_test("deps missing", test_controller_deps_missing);
  run_test("heuristic retry", test_controller_heuristic_retry);
  run_test("timeout not retried", test_controller_timeout_not_retried);
  run_test("budget exhaustion", test_controller_budget_exhaustion);
  run_test("rejected fix", test_controller_rejected_fix);
  run_test("fix with missing dependency", test_controller_fix_with_missing_dependency);
  run_test("no-fix paths", test_controller_no_fix_paths);
  run_test("timeout clamp", test_controller_clamps_timeout);

  std::cout << "\n[Run Ledger]\n";
  run_test("run id format", test_run_id_format);
  run_test("ledger files", test_ledger_files);
  run_test("list order and limit", test_list_runs_order_and_limit);
  run_test("concurrent index appends", test_index_concurrent_appends);

  std::cout << "\n[Retention]\n";
  run_test("age-based cleanup", test_retention_age);
  run_test("remove all", test_retention_remove_all);
  run_test("sweep skips unremovable", test_retention_sweep_skips_unremovable);

  std::cout << "\n[Observability]\n";
  run_test("latency histogram", test_latency_histogram);
  run_test("engine stats", test_engine_stats);
  run_test("event log publisher", test_event_log_publisher);

  std::cout << "\n[Engine]\n";
  run_test("blocked run persisted", test_engine_blocked_run_persisted);
  run_test("bad session rejected", test_engine_rejects_bad_session);
  run_test("paths resolved through workspace", test_engine_resolves_paths_through_workspace);
  run_test("shell interpreter", test_engine_with_shell_interpreter);
  run_test("spawn failure raises", test_engine_spawn_failure_raises);
  run_test("python ok with artifacts", test_engine_python_ok_with_artifacts);
  run_test("python error detail", test_engine_python_error_detail);
  run_test("python timeout", test_engine_python_timeout);
  run_test("python deps missing", test_engine_python_deps_missing);
  run_test("python heuristic fix", test_engine_python_heuristic);
  run_test("artifacts not double counted", test_engine_python_artifacts_not_double_counted);
  run_test("publisher failure counted", test_engine_publisher_failure_counted);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed";
  if (g_tests_skipped) std::cout << " (" << g_tests_skipped << " skipped)";
  std::cout << " ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
