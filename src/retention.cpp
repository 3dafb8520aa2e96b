#include "scriptward/retention.hpp"

#include <sys/stat.h>

#include <chrono>
#include <vector>

#include "scriptward/config.hpp"
#include "scriptward/observability.hpp"

namespace fs = std::filesystem;

namespace scriptward {

namespace {

struct SweepResult {
  std::uint64_t regular_files{0};
  bool removed{false};
};

// Removes dir entry by entry: files and links first, then directories deepest
// first, then dir itself. An entry that cannot be removed is skipped and the
// sweep carries on with the rest. Symlinks are removed, never followed.
SweepResult sweep_run_dir(const fs::path& dir) {
  SweepResult result;
  std::vector<fs::path> dirs;
  std::vector<fs::path> others;
  std::error_code ec;
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (!ec) {
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
      if (ec) break;
      std::error_code sec;
      const fs::file_status st = it->symlink_status(sec);
      if (sec) continue;
      if (fs::is_directory(st)) {
        dirs.push_back(it->path());
      } else {
        if (fs::is_regular_file(st)) ++result.regular_files;
        others.push_back(it->path());
      }
    }
  }

  for (const auto& p : others) {
    std::error_code rec;
    fs::remove(p, rec);
  }
  // Pre-order traversal, so reverse order visits children before parents.
  for (auto d = dirs.rbegin(); d != dirs.rend(); ++d) {
    std::error_code rec;
    fs::remove(*d, rec);
  }
  std::error_code rec;
  fs::remove(dir, rec);
  result.removed = !fs::exists(fs::symlink_status(dir, rec));
  return result;
}

bool mtime_seconds(const fs::path& p, std::int64_t* out) {
  struct stat st;
  if (::lstat(p.c_str(), &st) != 0) return false;
  *out = static_cast<std::int64_t>(st.st_mtim.tv_sec);
  return true;
}

}  // namespace

CleanupReport cleanup_runs(const RunLedger& ledger, const std::string& session_id,
                           int max_age_hours, bool remove_all) {
  CleanupReport report;
  report.session_id = session_id;

  const fs::path runs_dir = ledger.runs_dir();
  std::error_code ec;
  if (!fs::is_directory(runs_dir, ec)) return report;

  const std::int64_t now = static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  const std::int64_t cutoff =
      now - static_cast<std::int64_t>(clamp_max_age_hours(max_age_hours)) * 3600;

  fs::directory_iterator it(runs_dir, ec);
  if (ec) return report;
  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) break;
    const fs::path dir = it->path();
    const std::string name = dir.filename().string();
    if (name.empty() || name[0] == '.' || name == "__pycache__") continue;
    std::error_code sec;
    if (!fs::is_directory(it->symlink_status(sec)) || sec) continue;

    if (!remove_all) {
      std::int64_t mtime = 0;
      if (!mtime_seconds(dir, &mtime) || mtime >= cutoff) continue;
    }

    const SweepResult swept = sweep_run_dir(dir);
    if (swept.removed) {
      ++report.removed_runs;
      report.removed_files += swept.regular_files;
    }
  }

  if (remove_all && !ledger.truncate_index()) {
    global_engine_stats().record_failure(ErrorCode::io_failed);
  }
  return report;
}

}  // namespace scriptward
