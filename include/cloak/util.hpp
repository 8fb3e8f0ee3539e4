#pragma once
#include "cloak/cloak_common.hpp"
#include "cloak/secure_buffer.hpp"

#include <utility>

namespace cloak {

// ---------- Scope guard ----------
// Runs `fn` when the guard leaves scope, including during unwinding.
template <typename Fn>
class ScopeExit {
public:
    explicit ScopeExit(Fn fn) : fn_(std::move(fn)) {}

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

    ~ScopeExit() { fn_(); }

private:
    Fn fn_;
};

template <typename Fn>
ScopeExit<Fn> make_scope_exit(Fn fn) {
    return ScopeExit<Fn>(std::move(fn));
}

// ---------- SessionID ----------
std::string generate_session_id();

// ---------- Hex ----------
std::string to_hex(const byte* data, size_t len);

// ---------- Scrubbing ----------
void scrub_string(std::string& s);
void scrub_bytes(std::vector<byte>& v);

// ---------- Secure input ----------
// Reads one line from stdin with terminal echo disabled.
SecureBuffer get_password_secure(const char* prompt);

} // namespace cloak
