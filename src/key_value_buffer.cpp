#include "cloak/key_value_buffer.hpp"
#include "cloak/logging.hpp"

#include <stdexcept>
#include <utility>

namespace cloak {

KeyValueBuffer::KeyValueBuffer(size_t length)
    : key_(length), value_(length), length_(length)
{
}

KeyValueBuffer::KeyValueBuffer(KeyValueBuffer&& other) noexcept
    : key_(std::move(other.key_)),
      value_(std::move(other.value_)),
      length_(other.length_),
      destroyed_(other.destroyed_)
{
    other.length_ = 0;
    other.destroyed_ = true;
}

KeyValueBuffer& KeyValueBuffer::operator=(KeyValueBuffer&& other) noexcept {
    if (this != &other) {
        destroy();
        key_ = std::move(other.key_);
        value_ = std::move(other.value_);
        length_ = other.length_;
        destroyed_ = other.destroyed_;
        other.length_ = 0;
        other.destroyed_ = true;
    }
    return *this;
}

KeyValueBuffer KeyValueBuffer::allocate(size_t length, RandomSource& random) {
    if (length > MAX_SECRET_LEN) {
        audit_log_level(LogLevel::ERROR,
            "KeyValueBuffer::allocate: secret too large",
            "secure_memory",
            "failure");
        throw std::length_error("KeyValueBuffer: secret exceeds MAX_SECRET_LEN");
    }

    KeyValueBuffer kv(length);
    random.fill(kv.key(), length);
    return kv;
}

std::int32_t KeyValueBuffer::obfuscated_hash() const {
    // 31-polynomial over the value bytes, folded into the non-negative int32 range
    std::uint32_t h = 1;
    const byte* p = value_.data();
    for (size_t i = 0; i < length_; ++i) {
        h = 31u * h + static_cast<std::uint32_t>(p[i]);
    }
    return static_cast<std::int32_t>(h & 0x7FFFFFFFu);
}

void KeyValueBuffer::destroy() noexcept {
    if (destroyed_) {
        return;
    }
    key_.wipe();
    value_.wipe();
    length_ = 0;
    destroyed_ = true;
}

} // namespace cloak
