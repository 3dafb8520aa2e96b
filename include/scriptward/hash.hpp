#pragma once

// scriptward/hash.hpp - BLAKE3 hashing, plus the SHA-256 content hash the
// run ledger records for every attempt.

#include <string>
#include <string_view>

namespace scriptward {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing: the domain prefix is fed to the hasher before the
// payload so digests from different contexts never collide.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Digest recorded on every Attempt for the source it ran.
std::string code_digest(std::string_view source);

// Plain SHA-256, lower-case hex. Fills Attempt::code_sha256. Throws
// EngineError(io_failed) if the crypto library cannot produce a digest.
std::string sha256_hex(std::string_view payload);

}  // namespace scriptward
