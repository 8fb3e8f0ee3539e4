#pragma once
#include "cloak/cloak_common.hpp"

namespace cloak {

// Source of key bytes for obfuscation. Not required to be cryptographically strong.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual void fill(byte* out, size_t len) = 0;
};

// libsodium randombytes_buf
class SodiumRandomSource : public RandomSource {
public:
    void fill(byte* out, size_t len) override;
};

// Shared default instance
RandomSource& default_random_source();

} // namespace cloak
