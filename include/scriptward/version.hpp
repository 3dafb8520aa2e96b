#pragma once

// scriptward/version.hpp - Version manifest for every on-disk format.
//
// INVARIANT:
//   All version constants are compile-time. Readers of result.json,
//   runs.jsonl and the event log check the matching constant before trusting
//   field layout. Never change a field name without bumping its version.

#include <cstdint>
#include <string>

namespace scriptward {
namespace version {

// result.json and attempts.jsonl layout.
constexpr uint32_t LEDGER_FORMAT_VERSION = 1;

// runs.jsonl line layout (run_id, started_at, status,
// execution_time_seconds, created_files).
constexpr uint32_t INDEX_FORMAT_VERSION = 1;

// Run event / artifact event JSONL layout.
constexpr uint32_t EVENT_FORMAT_VERSION = 1;

// Version 1 = BLAKE3-256 with the "code:" domain prefix, hex encoded.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

constexpr const char* ENGINE_SEMVER = "1.0.0";

struct VersionManifest {
  uint32_t ledger_format{LEDGER_FORMAT_VERSION};
  uint32_t index_format{INDEX_FORMAT_VERSION};
  uint32_t event_format{EVENT_FORMAT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace scriptward
