#pragma once

// scriptward/artifacts.hpp - Artifact Tracker.
//
// A Snapshot maps every regular file under a run directory (symlinks are
// neither followed nor recorded) to its size and mtime. Diffing two
// snapshots yields the files created or modified in between.

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "scriptward/types.hpp"

namespace scriptward {

struct FileStamp {
  std::uint64_t size{0};
  std::int64_t mtime_ns{0};

  bool operator==(const FileStamp&) const = default;
};

// Keys are '/'-separated paths relative to the snapshot root.
using Snapshot = std::map<std::string, FileStamp>;

// Best-effort: unreadable subtrees are skipped. Files named in
// excluded_top_level are ignored only when they sit directly in run_dir.
Snapshot take_snapshot(const std::filesystem::path& run_dir,
                       const std::vector<std::string>& excluded_top_level);

// Paths only in `after`, plus paths in both whose size or mtime changed.
// Sorted.
std::vector<std::string> changed_paths(const Snapshot& before, const Snapshot& after);

// FileMeta for each path (relative to run_dir), sorted by path. Paths that
// vanished in the meantime are omitted.
std::vector<FileMeta> describe_files(const std::filesystem::path& run_dir,
                                     const std::vector<std::string>& paths);

// Best-effort MIME type by extension; empty when unknown.
std::string mime_type_for(const std::string& path);

}  // namespace scriptward
