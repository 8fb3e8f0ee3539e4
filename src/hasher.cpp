#include "cloak/hasher.hpp"
#include "cloak/logging.hpp"
#include "cloak/util.hpp"

#include <stdexcept>

namespace cloak {

static const byte k_empty[1] = { 0 };

std::string Sha256Hasher::hash_bytes(const byte* data, size_t len) const {
    ensure_sodium_ready();

    byte digest[crypto_hash_sha256_BYTES];
    if (crypto_hash_sha256(digest, len ? data : k_empty, len) != 0) {
        audit_log_level(LogLevel::ERROR,
            "Sha256Hasher: crypto_hash_sha256 failed",
            "hasher",
            "failure");
        throw std::runtime_error("Sha256Hasher: crypto_hash_sha256 failed");
    }
    std::string out = to_hex(digest, sizeof(digest));
    sodium_memzero(digest, sizeof(digest));
    return out;
}

std::string Blake2bHasher::hash_bytes(const byte* data, size_t len) const {
    ensure_sodium_ready();

    byte digest[BLAKE2B_TAG_BYTES];
    if (crypto_generichash(digest, sizeof(digest), len ? data : k_empty, len, nullptr, 0) != 0) {
        audit_log_level(LogLevel::ERROR,
            "Blake2bHasher: crypto_generichash failed",
            "hasher",
            "failure");
        throw std::runtime_error("Blake2bHasher: crypto_generichash failed");
    }
    std::string out = to_hex(digest, sizeof(digest));
    sodium_memzero(digest, sizeof(digest));
    return out;
}

const Hasher& default_hasher() {
    static const Sha256Hasher hasher;
    return hasher;
}

const Hasher* find_hasher(const std::string& name) {
    static const Sha256Hasher sha256;
    static const Blake2bHasher blake2b;

    if (name == sha256.name()) return &sha256;
    if (name == blake2b.name()) return &blake2b;
    return nullptr;
}

} // namespace cloak
