#include "cloak/random_source.hpp"

namespace cloak {

void SodiumRandomSource::fill(byte* out, size_t len) {
    if (len == 0) return;
    ensure_sodium_ready();
    randombytes_buf(out, len);
}

RandomSource& default_random_source() {
    static SodiumRandomSource source;
    return source;
}

} // namespace cloak
