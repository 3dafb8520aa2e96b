#include "scriptward/hash.hpp"

// Digests are BLAKE3-256, hex encoded to 64 chars. The "code:" domain prefix
// is part of the ledger contract; changing it requires bumping
// version::HASH_ALGORITHM_VERSION.

#include <array>

#include <openssl/evp.h>

#include "scriptward/types.hpp"

extern "C" {
#include <blake3.h>
}

namespace scriptward {
namespace {

// MICRO_OPT: lookup table for hex encoding, no per-nibble branching.
constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string code_digest(std::string_view source) {
  return hash_domain("code:", source);
}

std::string sha256_hex(std::string_view payload) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int len = 0;
  if (EVP_Digest(payload.data(), payload.size(), md.data(), &len, EVP_sha256(), nullptr) != 1) {
    throw EngineError(ErrorCode::io_failed, "sha256 digest failed");
  }
  return to_hex(md.data(), len);
}

}  // namespace scriptward
