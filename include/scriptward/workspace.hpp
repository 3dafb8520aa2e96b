#pragma once

// scriptward/workspace.hpp - Per-session storage root.
//
// The engine never builds session paths itself: it asks a Workspace for the
// granted root and resolves relative paths through safe_path(), which refuses
// anything that would land outside that root (.., absolute paths, symlinks
// pointing elsewhere).

#include <filesystem>
#include <optional>
#include <string>

namespace scriptward {

class Workspace {
 public:
  virtual ~Workspace() = default;

  // Granted root. Created on first use; throws EngineError(io_failed) when it
  // cannot be created.
  virtual std::filesystem::path root() const = 0;

  // Resolves relative against root(). nullopt when the result escapes it.
  virtual std::optional<std::filesystem::path> safe_path(const std::string& relative) const = 0;
};

// Rooted at <workspace_dir>/<session_id>. A session_id that is empty or
// contains '/', '\\' or ".." is rejected with EngineError(path_escape).
class LocalWorkspace final : public Workspace {
 public:
  LocalWorkspace(std::filesystem::path workspace_dir, const std::string& session_id);

  std::filesystem::path root() const override;
  std::optional<std::filesystem::path> safe_path(const std::string& relative) const override;

  const std::string& session_id() const { return session_id_; }

 private:
  std::filesystem::path root_;
  std::string session_id_;
};

// Canonical form of base/relative if it stays under base, else nullopt.
std::optional<std::filesystem::path> normalize_under(const std::filesystem::path& base,
                                                     const std::string& relative);

}  // namespace scriptward
