#pragma once

#include <sodium.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace cloak {

using byte = unsigned char;

// -------- Configuration constants --------
inline constexpr const char* SECRET_TAG = "** SECRET **"; // display placeholder
inline constexpr std::int32_t DESTROYED_HASH = -1;

inline constexpr const char* ENV_AUDIT_LOG = "CLOAK_AUDIT_LOG";
inline constexpr const char* ENV_LOG_LEVEL = "CLOAK_LOG_LEVEL";
inline constexpr const char* ENV_COLLECT_LOCATION = "CLOAK_COLLECT_DESTRUCTION_LOCATION";

inline constexpr size_t SHA256_HEX_LEN = crypto_hash_sha256_BYTES * 2;
inline constexpr size_t BLAKE2B_TAG_BYTES = crypto_generichash_BYTES;

// limits
inline constexpr size_t MAX_SECRET_LEN = 1024 * 1024; // 1 MB hard cap per secret
inline constexpr size_t MAX_PROMPT_LEN = 4096;

// Initialize libsodium once. Throws std::runtime_error on failure.
void ensure_sodium_ready();

} // namespace cloak
