#include "scriptward/workspace.hpp"

#include "scriptward/types.hpp"

namespace fs = std::filesystem;

namespace scriptward {

std::optional<fs::path> normalize_under(const fs::path& base, const std::string& relative) {
  std::error_code ec;
  const fs::path canon_base = fs::weakly_canonical(base, ec);
  if (ec) return std::nullopt;
  if (relative.empty()) return canon_base;
  const fs::path rel(relative);
  if (rel.is_absolute() || rel.has_root_name()) return std::nullopt;
  const fs::path in = fs::weakly_canonical(canon_base / rel, ec);
  if (ec) return std::nullopt;

  const std::string base_str = canon_base.string();
  const std::string in_str = in.string();
  if (in_str != base_str && !in_str.starts_with(base_str + "/")) return std::nullopt;
  return in;
}

LocalWorkspace::LocalWorkspace(fs::path workspace_dir, const std::string& session_id)
    : session_id_(session_id) {
  if (session_id.empty() || session_id.find('/') != std::string::npos ||
      session_id.find('\\') != std::string::npos || session_id.find("..") != std::string::npos ||
      session_id.find('\0') != std::string::npos) {
    throw EngineError(ErrorCode::path_escape, "invalid session_id: '" + session_id + "'");
  }
  root_ = std::move(workspace_dir) / session_id;
}

fs::path LocalWorkspace::root() const {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw EngineError(ErrorCode::io_failed,
                      "cannot create session root " + root_.string() + ": " + ec.message());
  }
  return root_;
}

std::optional<fs::path> LocalWorkspace::safe_path(const std::string& relative) const {
  return normalize_under(root(), relative);
}

}  // namespace scriptward
