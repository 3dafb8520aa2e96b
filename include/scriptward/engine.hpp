#pragma once

// scriptward/engine.hpp - Public entry points.
//
// Engine holds an immutable EngineConfig plus thread-safe collaborators, so
// execute(), list_runs() and cleanup() may be called concurrently. Each
// execute() owns a fresh run directory; the per-session index is the only
// shared file (see ledger.hpp).
//
// ERRORS: normal outcomes come back as a Run status. EngineError is thrown
// only when the run directory cannot be created or written, the workspace
// refuses the session, or the interpreter cannot be spawned.

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "scriptward/config.hpp"
#include "scriptward/fixer.hpp"
#include "scriptward/observability.hpp"
#include "scriptward/parser.hpp"
#include "scriptward/resolver.hpp"
#include "scriptward/types.hpp"
#include "scriptward/validator.hpp"
#include "scriptward/workspace.hpp"

namespace scriptward {

using WorkspaceFactory = std::function<std::unique_ptr<Workspace>(const std::string& session_id)>;

// Every member is optional; empty members get the shipped implementation
// built from EngineConfig.
struct EngineCollaborators {
  std::shared_ptr<const Parser> parser;
  std::shared_ptr<const ModuleResolver> resolver;
  // Replaces the whole fixer chain when non-empty.
  std::vector<std::shared_ptr<const Fixer>> fixers;
  // Used by the default chain's RemoteFixer. When empty, a CommandFixClient
  // is built if EngineConfig::fixer_command is set.
  std::shared_ptr<const RemoteFixClient> remote_fix_client;
  std::shared_ptr<ArtifactPublisher> publisher;
  WorkspaceFactory workspace_factory;
};

class Engine {
 public:
  explicit Engine(EngineConfig config, EngineCollaborators collaborators = {});

  Run execute(const ExecuteRequest& request) const;
  RunList list_runs(const std::string& session_id, int limit) const;
  CleanupReport cleanup(const std::string& session_id, int max_age_hours, bool remove_all) const;

  const EngineConfig& config() const { return config_; }
  const Validator& validator() const { return *validator_; }

  // Allowlisted inherited variables plus injected constants; per-run metadata
  // is added on top for guest processes.
  const std::map<std::string, std::string>& base_environment() const { return base_env_; }

 private:
  std::unique_ptr<Workspace> open_workspace(const std::string& session_id) const;

  EngineConfig config_;
  std::map<std::string, std::string> base_env_;
  std::unique_ptr<Validator> validator_;
  std::shared_ptr<const ModuleResolver> resolver_;
  std::vector<std::shared_ptr<const Fixer>> fixers_;
  std::shared_ptr<ArtifactPublisher> publisher_;
  WorkspaceFactory workspace_factory_;
};

}  // namespace scriptward
