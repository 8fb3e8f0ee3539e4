#pragma once
#include "cloak/cloak_common.hpp"
#include "cloak/random_source.hpp"
#include "cloak/secure_buffer.hpp"

namespace cloak {

// Random key bytes plus the obfuscated value bytes, always of equal length.
// Move-only; exactly one owner.
class KeyValueBuffer {
public:
    // Key filled from `random`, value zeroed.
    static KeyValueBuffer allocate(size_t length, RandomSource& random = default_random_source());

    // A moved-from pair reports itself destroyed
    KeyValueBuffer(KeyValueBuffer&& other) noexcept;
    KeyValueBuffer& operator=(KeyValueBuffer&& other) noexcept;
    KeyValueBuffer(const KeyValueBuffer&) = delete;
    KeyValueBuffer& operator=(const KeyValueBuffer&) = delete;

    ~KeyValueBuffer() { destroy(); }

    size_t size() const { return length_; }

    byte* key() { return key_.data(); }
    const byte* key() const { return key_.data(); }
    byte* value() { return value_.data(); }
    const byte* value() const { return value_.data(); }

    // Non-negative hash of the value buffer's current bytes.
    std::int32_t obfuscated_hash() const;

    // Zero both buffers and release them. Idempotent.
    void destroy() noexcept;
    bool is_destroyed() const { return destroyed_; }

private:
    explicit KeyValueBuffer(size_t length);

    SecureBuffer key_;
    SecureBuffer value_;
    size_t length_ = 0;
    bool destroyed_ = false;
};

} // namespace cloak
