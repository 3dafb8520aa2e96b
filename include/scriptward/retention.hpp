#pragma once

// scriptward/retention.hpp - Retention Manager.
//
// Best-effort purge of run directories. Individual failures are skipped and
// never abort the sweep; nothing here throws for filesystem errors.

#include <string>

#include "scriptward/ledger.hpp"
#include "scriptward/types.hpp"

namespace scriptward {

// remove_all: delete every run directory and empty the index.
// Otherwise: delete run directories whose mtime is older than
// now - clamp_max_age_hours(max_age_hours). Directories whose name starts
// with '.' and __pycache__ are never touched. removed_files counts regular
// files found before removal in directories that were actually removed.
CleanupReport cleanup_runs(const RunLedger& ledger, const std::string& session_id,
                           int max_age_hours, bool remove_all);

}  // namespace scriptward
