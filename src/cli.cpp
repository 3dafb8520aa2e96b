#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "scriptward/config.hpp"
#include "scriptward/engine.hpp"
#include "scriptward/hash.hpp"
#include "scriptward/jsonlite.hpp"
#include "scriptward/observability.hpp"
#include "scriptward/parser.hpp"
#include "scriptward/sandbox.hpp"
#include "scriptward/validator.hpp"
#include "scriptward/version.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0"
#endif

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRunFailed = 1;
constexpr int kExitInfra = 2;
constexpr int kHousekeepingMaxAgeHours = 24;

bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  out->assign((std::istreambuf_iterator<char>(ifs)),
              std::istreambuf_iterator<char>());
  return !ifs.bad();
}

int fail(const std::string &message, const std::string &code = "") {
  std::cerr << "{\"error\":\"" << scriptward::jsonlite::escape(message) << "\"";
  if (!code.empty())
    std::cerr << ",\"code\":\"" << code << "\"";
  std::cerr << "}\n";
  return kExitInfra;
}

int usage() {
  std::cerr
      << "usage: scriptward <command> [options]\n"
         "  exec --session S (--file F | --code C) [--timeout N]\n"
         "       [--max-attempts N] [--no-auto-correct] [--no-housekeeping]\n"
         "  runs list --session S [--limit N] [--no-housekeeping]\n"
         "  cleanup --session S [--max-age-hours H | --all]\n"
         "  validate (--file F | --code C)\n"
         "  config check --config FILE\n"
         "  doctor | version | stats\n"
         "Every command accepts --config FILE.\n";
  return kExitInfra;
}

// Flags after the command words. Value flags take the following argument.
struct Args {
  std::vector<std::string> argv;

  bool has(const std::string &flag) const {
    for (const auto &a : argv)
      if (a == flag)
        return true;
    return false;
  }
  std::string value(const std::string &flag, const std::string &def = "") const {
    for (size_t i = 0; i + 1 < argv.size(); ++i)
      if (argv[i] == flag)
        return argv[i + 1];
    return def;
  }
  // False when the flag is present but not an integer.
  bool int_value(const std::string &flag, int *out) const {
    if (!has(flag))
      return true;
    const std::string v = value(flag);
    const char *b = v.data();
    const char *e = v.data() + v.size();
    auto res = std::from_chars(b, e, *out);
    return !v.empty() && res.ec == std::errc() && res.ptr == e;
  }
};

bool load_config(const Args &args, scriptward::EngineConfig *config,
                 std::string *error) {
  *config = scriptward::EngineConfig::from_env();
  const std::string path = args.value("--config");
  if (path.empty())
    return true;
  return scriptward::load_config_file(path, *config, error);
}

// --file wins over --code.
bool read_source(const Args &args, std::string *source, std::string *error) {
  const std::string file = args.value("--file");
  if (!file.empty()) {
    if (!read_file(file, source)) {
      *error = "cannot read " + file;
      return false;
    }
    return true;
  }
  if (args.has("--code")) {
    *source = args.value("--code");
    return true;
  }
  *error = "one of --file or --code is required";
  return false;
}

bool verify_hash_vectors() {
  if (scriptward::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262")
    return false;
  if (scriptward::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f")
    return false;
  if (scriptward::sha256_hex("abc") !=
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad")
    return false;
  return true;
}

std::string string_list_json(const std::vector<std::string> &items) {
  std::string out = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i)
      out += ",";
    out += "\"" + scriptward::jsonlite::escape(items[i]) + "\"";
  }
  return out + "]";
}

void housekeeping(const scriptward::Engine &engine, const Args &args,
                  const std::string &session) {
  if (args.has("--no-housekeeping"))
    return;
  engine.cleanup(session, kHousekeepingMaxAgeHours, false);
}

int cmd_exec(const Args &args, const scriptward::EngineConfig &config) {
  scriptward::ExecuteRequest req;
  req.session_id = args.value("--session");
  if (req.session_id.empty())
    return fail("--session is required");
  std::string error;
  if (!read_source(args, &req.source, &error))
    return fail(error);
  req.timeout_seconds = config.default_timeout_seconds;
  if (!args.int_value("--timeout", &req.timeout_seconds))
    return fail("--timeout must be an integer");
  if (!args.int_value("--max-attempts", &req.max_attempts))
    return fail("--max-attempts must be an integer");
  req.auto_correct = !args.has("--no-auto-correct");

  const scriptward::Engine engine(config);
  housekeeping(engine, args, req.session_id);
  const auto run = engine.execute(req);
  std::cout << scriptward::run_to_json(run) << "\n";
  return run.status == scriptward::RunStatus::ok ? kExitOk : kExitRunFailed;
}

int cmd_runs_list(const Args &args, const scriptward::EngineConfig &config) {
  const std::string session = args.value("--session");
  if (session.empty())
    return fail("--session is required");
  int limit = 50;
  if (!args.int_value("--limit", &limit))
    return fail("--limit must be an integer");

  const scriptward::Engine engine(config);
  housekeeping(engine, args, session);
  std::cout << scriptward::run_list_to_json(engine.list_runs(session, limit))
            << "\n";
  return kExitOk;
}

int cmd_cleanup(const Args &args, const scriptward::EngineConfig &config) {
  const std::string session = args.value("--session");
  if (session.empty())
    return fail("--session is required");
  int max_age_hours = kHousekeepingMaxAgeHours;
  if (!args.int_value("--max-age-hours", &max_age_hours))
    return fail("--max-age-hours must be an integer");

  const scriptward::Engine engine(config);
  const auto report = engine.cleanup(session, max_age_hours, args.has("--all"));
  std::cout << scriptward::cleanup_report_to_json(report) << "\n";
  return kExitOk;
}

int cmd_validate(const Args &args, const scriptward::EngineConfig &config) {
  std::string source, error;
  if (!read_source(args, &source, &error))
    return fail(error);
  const scriptward::Validator validator(
      config.validation, std::make_shared<const scriptward::PythonTokenParser>());
  const auto v = validator.validate(source);
  std::cout << scriptward::validation_to_json(v) << "\n";
  return v.ok ? kExitOk : kExitRunFailed;
}

int cmd_config_check(const Args &args) {
  const std::string path = args.value("--config");
  if (path.empty())
    return fail("--config is required");
  std::string text;
  if (!read_file(path, &text))
    return fail("cannot read " + path);
  const auto r = scriptward::validate_config(text);
  std::cout << scriptward::config_validation_to_json(r) << "\n";
  return r.ok ? kExitOk : kExitRunFailed;
}

int cmd_doctor(const scriptward::EngineConfig &config) {
  std::vector<std::string> blockers;

  const std::string interpreter = scriptward::find_executable(config.interpreter);
  if (interpreter.empty())
    blockers.push_back("interpreter_not_found");

  const auto h = scriptward::hash_runtime_info();
  if (h.primitive != "blake3")
    blockers.push_back("hash_primitive_not_blake3");
  if (!verify_hash_vectors())
    blockers.push_back("hash_vectors_failed");

  const auto caps = scriptward::detect_platform_sandbox_capabilities();
  if (config.sandbox_enabled && !caps.rlimits_cpu)
    blockers.push_back("rlimits_unavailable");

  std::cout << "{\"ok\":" << (blockers.empty() ? "true" : "false")
            << ",\"blockers\":" << string_list_json(blockers);
  std::cout << ",\"engine_version\":\"" << PROJECT_VERSION << "\"";
  std::cout << ",\"interpreter\":\""
            << scriptward::jsonlite::escape(interpreter) << "\"";
  std::cout << ",\"hash_primitive\":\"" << h.primitive << "\"";
  std::cout << ",\"hash_version\":\"" << h.version << "\"";
  std::cout << ",\"sandbox\":{\"enabled\":"
            << (config.sandbox_enabled ? "true" : "false")
            << ",\"enforced\":" << string_list_json(caps.enforced())
            << ",\"unsupported\":" << string_list_json(caps.unsupported())
            << "}";
  std::cout << ",\"versions\":"
            << scriptward::version::manifest_to_json(
                   scriptward::version::current_manifest());
  std::cout << ",\"stats\":" << scriptward::global_engine_stats().to_json();
  std::cout << "}\n";
  return blockers.empty() ? kExitOk : kExitInfra;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2)
    return usage();
  const std::string cmd = argv[1];
  const std::string sub = argc >= 3 ? argv[2] : "";

  Args args;
  const int first_flag = (cmd == "runs" || cmd == "config") ? 3 : 2;
  for (int i = first_flag; i < argc; ++i)
    args.argv.push_back(argv[i]);

  if (cmd == "version") {
    std::cout << scriptward::version::manifest_to_json(
                     scriptward::version::current_manifest())
              << "\n";
    return kExitOk;
  }

  if (cmd == "stats") {
    std::cout << scriptward::global_engine_stats().to_json() << "\n";
    return kExitOk;
  }

  if (cmd == "config" && sub == "check")
    return cmd_config_check(args);

  scriptward::EngineConfig config;
  std::string config_error;
  if (!load_config(args, &config, &config_error))
    return fail(config_error, scriptward::to_string(
                                  scriptward::ErrorCode::config_invalid));

  try {
    if (cmd == "exec")
      return cmd_exec(args, config);
    if (cmd == "runs" && sub == "list")
      return cmd_runs_list(args, config);
    if (cmd == "cleanup")
      return cmd_cleanup(args, config);
    if (cmd == "validate")
      return cmd_validate(args, config);
    if (cmd == "doctor")
      return cmd_doctor(config);
  } catch (const scriptward::EngineError &e) {
    return fail(e.what(), scriptward::to_string(e.code()));
  } catch (const std::exception &e) {
    return fail(e.what());
  }
  return usage();
}
