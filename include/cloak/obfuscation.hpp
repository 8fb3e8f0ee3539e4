#pragma once
#include "cloak/cloak_common.hpp"
#include "cloak/key_value_buffer.hpp"
#include "cloak/random_source.hpp"
#include "cloak/secure_buffer.hpp"
#include "cloak/util.hpp"

#include <stdexcept>
#include <type_traits>

namespace cloak {

// -------- Byte codecs --------
// A codec maps a value to raw bytes and back:
//   size(v)          number of bytes written by write()
//   write(v, out)    serialize into `out` (size(v) bytes)
//   read(in, n)      rebuild a value from n bytes
//   scrub(v)         zero the value's own storage
// Specialize ByteCodec<T> to make T storable with the default strategy.
template <typename T, typename Enable = void>
struct ByteCodec;

template <typename T>
struct ByteCodec<T, std::enable_if_t<std::is_arithmetic<T>::value>> {
    static size_t size(const T&) { return sizeof(T); }

    static void write(const T& v, byte* out) {
        std::memcpy(out, &v, sizeof(T));
    }

    static T read(const byte* in, size_t n) {
        if (n != sizeof(T)) {
            throw std::invalid_argument("ByteCodec: size mismatch for arithmetic type");
        }
        T v{};
        std::memcpy(&v, in, sizeof(T));
        return v;
    }

    static void scrub(T& v) {
        sodium_memzero(&v, sizeof(T));
    }
};

template <>
struct ByteCodec<std::string> {
    static size_t size(const std::string& v) { return v.size(); }

    static void write(const std::string& v, byte* out) {
        if (!v.empty()) {
            std::memcpy(out, v.data(), v.size());
        }
    }

    static std::string read(const byte* in, size_t n) {
        if (n == 0) return std::string();
        return std::string(reinterpret_cast<const char*>(in), n);
    }

    static void scrub(std::string& v) {
        scrub_string(v);
    }
};

template <>
struct ByteCodec<std::vector<byte>> {
    static size_t size(const std::vector<byte>& v) { return v.size(); }

    static void write(const std::vector<byte>& v, byte* out) {
        if (!v.empty()) {
            std::memcpy(out, v.data(), v.size());
        }
    }

    static std::vector<byte> read(const byte* in, size_t n) {
        if (n == 0) return std::vector<byte>();
        return std::vector<byte>(in, in + n);
    }

    static void scrub(std::vector<byte>& v) {
        scrub_bytes(v);
    }
};


// -------- Ciphers --------
// seal() turns the plain bytes sitting in kv.value() into obfuscated bytes using kv.key();
// open() writes the plain bytes to `out` without touching kv.
struct XorCipher {
    static void seal(KeyValueBuffer& kv) {
        byte* v = kv.value();
        const byte* k = kv.key();
        for (size_t i = 0; i < kv.size(); ++i) {
            v[i] ^= k[i];
        }
    }

    static void open(const KeyValueBuffer& kv, byte* out) {
        const byte* v = kv.value();
        const byte* k = kv.key();
        for (size_t i = 0; i < kv.size(); ++i) {
            out[i] = v[i] ^ k[i];
        }
    }
};


// -------- Strategy --------
template <typename T, typename Codec = ByteCodec<T>, typename Cipher = XorCipher>
struct BasicObfuscationStrategy {
    using value_type = T;
    using codec_type = Codec;
    using cipher_type = Cipher;

    static KeyValueBuffer obfuscate(const T& value, RandomSource& random = default_random_source()) {
        const size_t n = Codec::size(value);
        KeyValueBuffer kv = KeyValueBuffer::allocate(n, random);
        if (n > 0) {
            Codec::write(value, kv.value());
            Cipher::seal(kv);
        }
        return kv;
    }

    // kv must not be destroyed
    static T deobfuscate(const KeyValueBuffer& kv) {
        const size_t n = kv.size();
        SecureBuffer plain(n);
        if (n > 0) {
            Cipher::open(kv, plain.data());
        }
        return Codec::read(plain.data(), n);
    }
};

// Per-type capability used by Secret<T> unless another strategy is named.
template <typename T>
struct ObfuscationStrategy : BasicObfuscationStrategy<T> {};

} // namespace cloak
