#pragma once

// scriptward/ledger.hpp - Run Ledger.
//
// LAYOUT (under the session root granted by the Workspace):
//   runs/<run_id>/source.<ext>     source of the first attempt
//   runs/<run_id>/attempts.jsonl   one Attempt per line, appended as produced
//   runs/<run_id>/result.json      the final Run, written once (tmp + rename)
//   runs/runs.jsonl                one RunSummary per line, per session
//
// CONCURRENCY:
//   Each Run owns its run directory exclusively. The index is the only shared
//   file: appends take a process-wide mutex for the path and then an advisory
//   flock(LOCK_EX), so threads and processes never interleave lines.
//
// All write operations throw EngineError(io_failed) on failure.

#include <filesystem>
#include <string>

#include "scriptward/types.hpp"

namespace scriptward {

// <UTC yyyymmddTHHMMSS><microseconds>-<12 random hex digits>. Lexicographic
// order follows creation time at microsecond resolution.
std::string make_run_id();

class RunLedger {
 public:
  explicit RunLedger(std::filesystem::path session_root);

  // Ledger over a runs directory that was already resolved, typically
  // through Workspace::safe_path("runs").
  static RunLedger at_runs_dir(std::filesystem::path runs_dir);

  std::filesystem::path runs_dir() const { return runs_dir_; }
  std::filesystem::path index_path() const { return runs_dir_ / "runs.jsonl"; }
  std::filesystem::path run_dir(const std::string& run_id) const { return runs_dir_ / run_id; }

  // Creates runs/<run_id>. Fails if it already exists.
  std::filesystem::path create_run_dir(const std::string& run_id) const;

  void write_source(const std::filesystem::path& run_dir, const std::string& file_name,
                    const std::string& source) const;
  void append_attempt(const std::filesystem::path& run_dir, const Attempt& attempt) const;
  void write_result(const std::filesystem::path& run_dir, const Run& run) const;
  void append_index(const RunSummary& summary) const;

  // Empties runs.jsonl under the index lock. Missing index is not an error.
  bool truncate_index() const;

  // At most `limit` (clamped to [1,200]) most recent entries by
  // (started_at, run_id), returned in ascending order. Malformed lines are
  // skipped; a missing index yields an empty list.
  RunList list_runs(const std::string& session_id, int limit) const;

 private:
  std::filesystem::path runs_dir_;
};

}  // namespace scriptward
