#include "scriptward/engine.hpp"

#include <cstdlib>

#include "scriptward/artifacts.hpp"
#include "scriptward/autocorrect.hpp"
#include "scriptward/ledger.hpp"
#include "scriptward/retention.hpp"
#include "scriptward/sandbox.hpp"

namespace fs = std::filesystem;

namespace scriptward {

namespace {

// Runs each attempt as <interpreter> <interpreter_args...> source.<ext> inside
// the run directory, diffing the directory around the execution.
class SandboxAttemptRunner final : public AttemptRunner {
 public:
  SandboxAttemptRunner(const EngineConfig& config, const RunLedger& ledger, fs::path run_dir,
                       std::map<std::string, std::string> env)
      : config_(config),
        ledger_(ledger),
        run_dir_(std::move(run_dir)),
        env_(std::move(env)),
        source_file_("source." + config.source_extension),
        excluded_{source_file_, "result.json", "result.json.tmp", "attempts.jsonl"} {}

  AttemptOutcome run(const std::string& source, int timeout_seconds) override {
    ledger_.write_source(run_dir_, source_file_, source);
    const Snapshot before = take_snapshot(run_dir_, excluded_);

    RlimitPolicy policy(ResourceLimits{static_cast<std::uint64_t>(timeout_seconds) + 1,
                                       config_.max_memory_bytes, config_.max_file_size_bytes,
                                       config_.max_open_files});
    ProcessSpec spec;
    spec.command = config_.interpreter;
    spec.argv = config_.interpreter_args;
    spec.argv.push_back(source_file_);
    spec.env = env_;
    spec.cwd = run_dir_.string();
    spec.timeout_ms = static_cast<std::uint64_t>(timeout_seconds) * 1000;
    spec.max_output_bytes = config_.output_cap_bytes;
    spec.policy = config_.sandbox_enabled ? &policy : nullptr;

    const ProcessResult r = run_process(spec);
    if (!r.spawned) {
      throw EngineError(ErrorCode::spawn_failed,
                        "cannot start interpreter '" + config_.interpreter + "': " + r.error_message);
    }

    AttemptOutcome out;
    out.status = r.timed_out ? RunStatus::timeout
                             : (r.exit_code == 0 ? RunStatus::ok : RunStatus::error);
    out.stdout_text = to_valid_utf8(r.stdout_text);
    out.stderr_text = to_valid_utf8(r.stderr_text);
    out.execution_time_seconds = static_cast<double>(r.duration_ns) / 1e9;
    out.changed_paths = changed_paths(before, take_snapshot(run_dir_, excluded_));
    return out;
  }

 private:
  const EngineConfig& config_;
  const RunLedger& ledger_;
  fs::path run_dir_;
  std::map<std::string, std::string> env_;
  std::string source_file_;
  std::vector<std::string> excluded_;
};

std::map<std::string, std::string> build_base_environment(const EngineConfig& config) {
  std::map<std::string, std::string> env;
  for (const auto& name : config.env_allowlist) {
    if (const char* v = std::getenv(name.c_str())) env[name] = v;
  }
  for (const auto& [k, v] : config.injected_env) env[k] = v;
  return env;
}

// Every ledger path is resolved through the workspace, so a workspace that
// confines sessions differently is honoured.
RunLedger open_ledger(const Workspace& workspace) {
  auto runs = workspace.safe_path("runs");
  if (!runs) throw EngineError(ErrorCode::path_escape, "workspace refused the runs directory");
  return RunLedger::at_runs_dir(std::move(*runs));
}

void check_run_dir(const Workspace& workspace, const RunLedger& ledger,
                   const std::string& run_id) {
  const auto dir = workspace.safe_path("runs/" + run_id);
  if (!dir || *dir != ledger.run_dir(run_id)) {
    throw EngineError(ErrorCode::path_escape, "workspace refused run directory " + run_id);
  }
}

void link_session_root(const fs::path& session_root, const fs::path& run_dir) {
  std::error_code ec;
  const fs::path target = fs::absolute(session_root, ec);
  if (ec) return;
  fs::create_directory_symlink(target, run_dir / "session", ec);
  // Optional: on failure the run simply has no session link.
}

void publish_artifacts(ArtifactPublisher& publisher, const Run& run) {
  EngineStats& stats = global_engine_stats();
  for (const auto& meta : run.created_files) {
    ArtifactEvent ev;
    ev.session_id = run.session_id;
    ev.run_id = run.run_id;
    ev.path = meta.path;
    ev.meta = meta;
    try {
      publisher.publish(ev);
      stats.artifacts_published.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception&) {
      stats.publisher_failures.fetch_add(1, std::memory_order_relaxed);
      stats.record_failure(ErrorCode::publisher_failed);
    }
  }
}

}  // namespace

Engine::Engine(EngineConfig config, EngineCollaborators collaborators)
    : config_(std::move(config)) {
  if (!config_.interpreter.empty()) {
    const std::string resolved = find_executable(config_.interpreter);
    if (!resolved.empty()) config_.interpreter = resolved;
  }
  base_env_ = build_base_environment(config_);

  std::shared_ptr<const Parser> parser = std::move(collaborators.parser);
  if (!parser) parser = std::make_shared<const PythonTokenParser>();
  validator_ = std::make_unique<Validator>(config_.validation, std::move(parser));

  resolver_ = std::move(collaborators.resolver);
  if (!resolver_) {
    resolver_ = std::make_shared<const InterpreterModuleResolver>(
        config_.interpreter, base_env_, config_.resolver_timeout_seconds);
  }

  if (!collaborators.fixers.empty()) {
    fixers_ = std::move(collaborators.fixers);
  } else {
    auto client = collaborators.remote_fix_client;
    if (!client && !config_.fixer_command.empty()) {
      client = std::make_shared<const CommandFixClient>(config_.fixer_command, base_env_,
                                                        config_.fixer_timeout_seconds,
                                                        config_.output_cap_bytes);
    }
    fixers_.push_back(std::make_shared<const HeuristicFixer>());
    fixers_.push_back(std::make_shared<const RemoteFixer>(std::move(client)));
  }

  publisher_ = std::move(collaborators.publisher);
  if (!publisher_) publisher_ = std::make_shared<EventLogArtifactPublisher>(config_.artifact_log_path);
  workspace_factory_ = std::move(collaborators.workspace_factory);
}

std::unique_ptr<Workspace> Engine::open_workspace(const std::string& session_id) const {
  if (workspace_factory_) {
    auto ws = workspace_factory_(session_id);
    if (!ws) throw EngineError(ErrorCode::path_escape, "workspace refused session " + session_id);
    return ws;
  }
  return std::make_unique<LocalWorkspace>(config_.workspace_dir, session_id);
}

Run Engine::execute(const ExecuteRequest& request) const {
  std::uint64_t duration_ns = 0;
  Run run;
  try {
    {
      ScopeTimer timer(duration_ns);
      const auto workspace = open_workspace(request.session_id);
      const fs::path session_root = workspace->root();
      const RunLedger ledger = open_ledger(*workspace);

      run.run_id = make_run_id();
      run.session_id = request.session_id;
      run.started_at = utc_now_iso();

      check_run_dir(*workspace, ledger, run.run_id);
      const fs::path run_dir = ledger.create_run_dir(run.run_id);
      if (config_.link_session_root) link_session_root(session_root, run_dir);
      ledger.write_source(run_dir, "source." + config_.source_extension, request.source);

      std::map<std::string, std::string> env = base_env_;
      env["SCRIPTWARD_SESSION_ID"] = run.session_id;
      env["SCRIPTWARD_RUN_ID"] = run.run_id;
      std::error_code ec;
      const fs::path abs_run_dir = fs::absolute(run_dir, ec);
      env["SCRIPTWARD_OUTPUT_DIR"] = ec ? run_dir.string() : abs_run_dir.string();

      SandboxAttemptRunner runner(config_, ledger, run_dir, std::move(env));
      const AutoCorrectController controller(
          *validator_, *resolver_, fixers_,
          ControllerLimits{config_.output_cap_bytes, config_.preview_cap_bytes,
                           config_.error_raw_cap_bytes});
      ControllerOutcome outcome = controller.run(
          request.source, request.timeout_seconds, request.auto_correct, request.max_attempts,
          runner, [&](const Attempt& a) { ledger.append_attempt(run_dir, a); });

      run.status = outcome.status;
      run.stdout_text = std::move(outcome.stdout_text);
      run.stderr_text = std::move(outcome.stderr_text);
      run.execution_time_seconds = outcome.execution_time_seconds;
      run.created_files = describe_files(run_dir, outcome.created_paths);
      run.attempts = std::move(outcome.attempts);
      run.validation = std::move(outcome.validation);
      run.missing_dependencies = std::move(outcome.missing_dependencies);

      ledger.write_result(run_dir, run);
      ledger.append_index(summarize(run));
    }
  } catch (const EngineError& e) {
    global_engine_stats().record_failure(e.code());
    throw;
  }

  publish_artifacts(*publisher_, run);

  RunEvent ev;
  ev.run_id = run.run_id;
  ev.session_id = run.session_id;
  ev.status = run.status;
  ev.attempts = static_cast<int>(run.attempts.size());
  for (const auto& a : run.attempts) {
    if (a.autocorrect && a.autocorrect->applied) ev.autocorrect_applied = true;
  }
  ev.duration_ns = duration_ns;
  ev.created_files = run.created_files.size();
  emit_run_event(ev);
  return run;
}

RunList Engine::list_runs(const std::string& session_id, int limit) const {
  const auto workspace = open_workspace(session_id);
  return open_ledger(*workspace).list_runs(session_id, limit);
}

CleanupReport Engine::cleanup(const std::string& session_id, int max_age_hours,
                              bool remove_all) const {
  const auto workspace = open_workspace(session_id);
  return cleanup_runs(open_ledger(*workspace), session_id, max_age_hours, remove_all);
}

}  // namespace scriptward
