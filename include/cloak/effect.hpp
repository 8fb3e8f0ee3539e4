#pragma once
#include "cloak/secret_error.hpp"

#include <exception>
#include <future>
#include <type_traits>
#include <utility>
#include <variant>

namespace cloak {

// -------- Result --------
// Synchronous value-or-SecretNoLongerValid.
template <typename U>
class Result {
public:
    using value_type = U;

    Result(U value)
        : state_(std::in_place_index<0>, std::move(value)) {}
    Result(SecretNoLongerValid error)
        : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return state_.index() == 0; }
    explicit operator bool() const { return ok(); }

    // Throws the stored error when not ok
    const U& value() const& {
        if (!ok()) throw std::get<1>(state_);
        return std::get<0>(state_);
    }
    U&& value() && {
        if (!ok()) throw std::get<1>(state_);
        return std::get<0>(std::move(state_));
    }

    U value_or(U fallback) const {
        return ok() ? std::get<0>(state_) : std::move(fallback);
    }

    const SecretNoLongerValid& error() const {
        if (ok()) throw std::logic_error("Result: error() called on a successful result");
        return std::get<1>(state_);
    }

    template <typename Fn>
    auto map(Fn&& fn) const -> Result<std::invoke_result_t<Fn&, const U&>> {
        if (!ok()) return std::get<1>(state_);
        return fn(std::get<0>(state_));
    }

private:
    std::variant<U, SecretNoLongerValid> state_;
};

template <>
class Result<void> {
public:
    using value_type = void;

    Result() = default;
    Result(SecretNoLongerValid error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    void value() const {
        if (error_) throw *error_;
    }

    const SecretNoLongerValid& error() const {
        if (ok()) throw std::logic_error("Result: error() called on a successful result");
        return *error_;
    }

private:
    std::optional<SecretNoLongerValid> error_;
};


// -------- Effect abstraction --------
// MonadSecretError<E> lifts a value into effect E (pure) or fails it with
// SecretNoLongerValid (raise). Specialize it to use Secret with other effect types.
template <typename Effect>
struct MonadSecretError;

template <typename U>
struct MonadSecretError<Result<U>> {
    static Result<U> pure(U value) { return Result<U>(std::move(value)); }
    static Result<U> raise(SecretNoLongerValid error) { return Result<U>(std::move(error)); }
};

template <>
struct MonadSecretError<Result<void>> {
    static Result<void> pure() { return Result<void>(); }
    static Result<void> raise(SecretNoLongerValid error) { return Result<void>(std::move(error)); }
};

// Deferred completion; failures surface from future::get()
template <typename U>
struct MonadSecretError<std::future<U>> {
    static std::future<U> pure(U value) {
        std::promise<U> p;
        p.set_value(std::move(value));
        return p.get_future();
    }

    static std::future<U> raise(SecretNoLongerValid error) {
        std::promise<U> p;
        p.set_exception(std::make_exception_ptr(std::move(error)));
        return p.get_future();
    }
};

template <>
struct MonadSecretError<std::future<void>> {
    static std::future<void> pure() {
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }

    static std::future<void> raise(SecretNoLongerValid error) {
        std::promise<void> p;
        p.set_exception(std::make_exception_ptr(std::move(error)));
        return p.get_future();
    }
};

} // namespace cloak
