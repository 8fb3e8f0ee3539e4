#pragma once
#include "cloak/cloak_common.hpp"
#include "cloak/obfuscation.hpp"
#include "cloak/secure_buffer.hpp"

namespace cloak {

// Deterministic, non-reversible tag for a plaintext, safe to log or serialize.
class Hasher {
public:
    virtual ~Hasher() = default;

    virtual const char* name() const = 0;

    // Lower-case hex digest of `len` bytes
    virtual std::string hash_bytes(const byte* data, size_t len) const = 0;

    template <typename T, typename Codec = ByteCodec<T>>
    std::string hash(const T& value) const {
        const size_t n = Codec::size(value);
        SecureBuffer plain(n);
        if (n > 0) {
            Codec::write(value, plain.data());
        }
        return hash_bytes(plain.data(), n);
    }
};

// SHA-256 (crypto_hash_sha256)
class Sha256Hasher : public Hasher {
public:
    const char* name() const override { return "sha256"; }
    std::string hash_bytes(const byte* data, size_t len) const override;
};

// BLAKE2b (crypto_generichash, unkeyed)
class Blake2bHasher : public Hasher {
public:
    const char* name() const override { return "blake2b"; }
    std::string hash_bytes(const byte* data, size_t len) const override;
};

const Hasher& default_hasher();

// nullptr for an unknown name
const Hasher* find_hasher(const std::string& name);

template <typename T>
std::string secret_tag(const T& value, const Hasher& hasher = default_hasher()) {
    return hasher.hash(value);
}

} // namespace cloak
