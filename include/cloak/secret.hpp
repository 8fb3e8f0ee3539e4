#pragma once
#include "cloak/cloak_common.hpp"
#include "cloak/effect.hpp"
#include "cloak/hasher.hpp"
#include "cloak/key_value_buffer.hpp"
#include "cloak/obfuscation.hpp"
#include "cloak/secret_error.hpp"
#include "cloak/util.hpp"

#include <functional>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace cloak {

enum class SecretKind { Persistent, OneShot };

namespace detail {
bool collect_destruction_location() noexcept;
void log_secret_destroyed(SecretKind kind, const std::optional<DestructionLocation>& loc) noexcept;
void log_access_denied(SecretKind kind, const std::optional<DestructionLocation>& loc);
} // namespace detail

/*
 * Obfuscated holder for a sensitive value of type T.
 *
 * The value is obfuscated by Strategy at construction and only exposed to a
 * callback through use/eval_use and friends; the decoded copy is scrubbed as
 * soon as the callback returns. A destroyed secret rejects every access with
 * SecretNoLongerValid, delivered through the caller's effect type.
 *
 * Persistent secrets live until destroy(); OneShot secrets also destroy
 * themselves after their first use.
 *
 * Callbacks receive a reference to a temporary: an effect that runs later
 * (std::future from std::async(deferred), ...) must capture what it needs by value.
 *
 * Not thread-safe.
 */
template <typename T, typename Strategy = ObfuscationStrategy<T>, SecretKind Kind = SecretKind::Persistent>
class BasicSecret {
public:
    using value_type = T;
    using strategy_type = Strategy;
    using codec_type = typename Strategy::codec_type;
    static constexpr SecretKind kind = Kind;

    explicit BasicSecret(const T& value, const Hasher& hasher = default_hasher())
        : buffer_(Strategy::obfuscate(value)),
          hashed_(hasher.template hash<T, codec_type>(value))
    {
    }

    // Also scrubs `value` once obfuscated
    explicit BasicSecret(T&& value, const Hasher& hasher = default_hasher())
        : BasicSecret(static_cast<const T&>(value), hasher)
    {
        codec_type::scrub(value);
    }

    BasicSecret(const BasicSecret&) = delete;
    BasicSecret& operator=(const BasicSecret&) = delete;

    // The moved-from secret is left destroyed
    BasicSecret(BasicSecret&& other) noexcept
        : buffer_(std::move(other.buffer_)),
          hashed_(std::move(other.hashed_)),
          destroyed_at_(other.destroyed_at_)
    {
        other.buffer_.reset();
    }

    BasicSecret& operator=(BasicSecret&& other) noexcept {
        if (this != &other) {
            buffer_ = std::move(other.buffer_);
            hashed_ = std::move(other.hashed_);
            destroyed_at_ = other.destroyed_at_;
            other.buffer_.reset();
        }
        return *this;
    }

    ~BasicSecret() = default;

    // ---------- Access ----------

    // f: const T& -> E, where MonadSecretError<E> exists. Returns f's result,
    // or E carrying SecretNoLongerValid without calling f when destroyed.
    template <typename Fn>
    auto eval_use(Fn&& f, DestructionLocation loc = DestructionLocation::current())
        -> std::invoke_result_t<Fn&, const T&>
    {
        using Effect = std::invoke_result_t<Fn&, const T&>;
        if (is_destroyed()) {
            return MonadSecretError<Effect>::raise(reject());
        }
        return consume(f, loc, Kind == SecretKind::OneShot);
    }

    // f: const T& -> U, lifted into F<U>
    template <template <typename> class F = Result, typename Fn>
    auto use(Fn&& f, DestructionLocation loc = DestructionLocation::current())
        -> F<std::invoke_result_t<Fn&, const T&>>
    {
        using Effect = F<std::invoke_result_t<Fn&, const T&>>;
        return eval_use([&f](const T& v) { return BasicSecret::template lift<Effect>(f, v); }, loc);
    }

    template <typename Fn>
    auto use_e(Fn&& f, DestructionLocation loc = DestructionLocation::current())
        -> Result<std::invoke_result_t<Fn&, const T&>>
    {
        return use<Result>(std::forward<Fn>(f), loc);
    }

    // Destroys the secret once f has run, whether f succeeded, failed or threw.
    template <typename Fn>
    auto eval_use_and_destroy(Fn&& f, DestructionLocation loc = DestructionLocation::current())
        -> std::invoke_result_t<Fn&, const T&>
    {
        using Effect = std::invoke_result_t<Fn&, const T&>;
        if (is_destroyed()) {
            return MonadSecretError<Effect>::raise(reject());
        }
        return consume(f, loc, true);
    }

    template <template <typename> class F = Result, typename Fn>
    auto use_and_destroy(Fn&& f, DestructionLocation loc = DestructionLocation::current())
        -> F<std::invoke_result_t<Fn&, const T&>>
    {
        using Effect = F<std::invoke_result_t<Fn&, const T&>>;
        return eval_use_and_destroy([&f](const T& v) { return BasicSecret::template lift<Effect>(f, v); }, loc);
    }

    template <typename Fn>
    auto use_and_destroy_e(Fn&& f, DestructionLocation loc = DestructionLocation::current())
        -> Result<std::invoke_result_t<Fn&, const T&>>
    {
        return use_and_destroy<Result>(std::forward<Fn>(f), loc);
    }

    // Avoid if possible: throws SecretNoLongerValid instead of returning it.
    template <typename Fn>
    auto unsafe_use(Fn&& f, DestructionLocation loc = DestructionLocation::current())
        -> std::invoke_result_t<Fn&, const T&>
    {
        if (is_destroyed()) {
            throw reject();
        }
        return consume(f, loc, Kind == SecretKind::OneShot);
    }

    // ---------- Lifecycle ----------

    // Zero and release the obfuscated bytes. Idempotent.
    void destroy(DestructionLocation loc = DestructionLocation::current()) noexcept {
        if (is_destroyed()) {
            return;
        }
        buffer_->destroy();
        buffer_.reset();
        if (detail::collect_destruction_location()) {
            destroyed_at_ = loc;
        }
        detail::log_secret_destroyed(Kind, destroyed_at_);
    }

    void close(DestructionLocation loc = DestructionLocation::current()) noexcept {
        destroy(loc);
    }

    bool is_destroyed() const noexcept { return !buffer_.has_value(); }

    const std::optional<DestructionLocation>& destruction_location() const noexcept {
        return destroyed_at_;
    }

    // ---------- Inspection ----------

    // Hash of the obfuscated bytes: differs between secrets built from the
    // same value. DESTROYED_HASH (-1) once destroyed.
    std::int32_t hash_code() const {
        return is_destroyed() ? DESTROYED_HASH : buffer_->obfuscated_hash();
    }

    // Compares plaintexts without destroying either side (OneShot included).
    // false if either side is destroyed or cannot be decoded.
    template <SecretKind OtherKind>
    bool is_equals(const BasicSecret<T, Strategy, OtherKind>& other) const noexcept {
        if (is_destroyed() || other.is_destroyed()) {
            return false;
        }
        try {
            T mine = peek();
            auto scrub_mine = make_scope_exit([&mine] { codec_type::scrub(mine); });
            T theirs = other.peek();
            auto scrub_theirs = make_scope_exit([&theirs] { codec_type::scrub(theirs); });
            return mine == theirs;
        }
        catch (const std::exception&) {
            return false;
        }
        catch (...) {
            // user codecs and operator== may throw non-std types
            return false;
        }
    }

    // Deterministic opaque tag of the original value, computed at construction
    const std::string& hashed() const noexcept { return hashed_; }

    std::string to_string() const { return SECRET_TAG; }

private:
    template <typename, typename, SecretKind>
    friend class BasicSecret;

    T peek() const {
        return Strategy::deobfuscate(*buffer_);
    }

    SecretNoLongerValid reject() const {
        detail::log_access_denied(Kind, destroyed_at_);
        return SecretNoLongerValid(destroyed_at_);
    }

    template <typename Effect, typename Fn>
    static Effect lift(Fn& f, const T& v) {
        if constexpr (std::is_void<std::invoke_result_t<Fn&, const T&>>::value) {
            std::invoke(f, v);
            return MonadSecretError<Effect>::pure();
        }
        else {
            return MonadSecretError<Effect>::pure(std::invoke(f, v));
        }
    }

    // Decode, hand the plaintext to f, scrub it, optionally destroy.
    template <typename Fn>
    std::invoke_result_t<Fn&, const T&> consume(Fn& f, const DestructionLocation& loc, bool destroy_after) {
        auto destroy_guard = make_scope_exit([this, &loc, destroy_after] {
            if (destroy_after) destroy(loc);
        });
        T plain = peek();
        auto scrub_guard = make_scope_exit([&plain] { codec_type::scrub(plain); });
        return std::invoke(f, static_cast<const T&>(plain));
    }

    std::optional<KeyValueBuffer> buffer_;
    std::string hashed_;
    std::optional<DestructionLocation> destroyed_at_;
};

template <typename T, typename Strategy = ObfuscationStrategy<T>>
using Secret = BasicSecret<T, Strategy, SecretKind::Persistent>;

template <typename T, typename Strategy = ObfuscationStrategy<T>>
using OneShotSecret = BasicSecret<T, Strategy, SecretKind::OneShot>;

template <typename T>
Secret<std::decay_t<T>> make_secret(T&& value) {
    return Secret<std::decay_t<T>>(std::forward<T>(value));
}

template <typename T>
OneShotSecret<std::decay_t<T>> make_one_shot_secret(T&& value) {
    return OneShotSecret<std::decay_t<T>>(std::forward<T>(value));
}

// Generic equality is disabled: always false, even for the same object. Use is_equals.
template <typename T, typename S, SecretKind K1, SecretKind K2>
bool operator==(const BasicSecret<T, S, K1>&, const BasicSecret<T, S, K2>&) noexcept {
    return false;
}

template <typename T, typename S, SecretKind K1, SecretKind K2>
bool operator!=(const BasicSecret<T, S, K1>&, const BasicSecret<T, S, K2>&) noexcept {
    return true;
}

template <typename T, typename S, SecretKind K>
std::ostream& operator<<(std::ostream& os, const BasicSecret<T, S, K>&) {
    return os << SECRET_TAG;
}

} // namespace cloak

namespace std {

template <typename T, typename S, cloak::SecretKind K>
struct hash<cloak::BasicSecret<T, S, K>> {
    size_t operator()(const cloak::BasicSecret<T, S, K>& s) const {
        return static_cast<size_t>(s.hash_code());
    }
};

} // namespace std
