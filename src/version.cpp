#include "scriptward/version.hpp"

#include <sstream>

namespace scriptward {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver   = ENGINE_SEMVER;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"ledger_format\":" << m.ledger_format
    << ",\"index_format\":" << m.index_format
    << ",\"event_format\":" << m.event_format
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace scriptward
