#include "cloak/util.hpp"
#include "cloak/logging.hpp"

#include <termios.h>
#include <unistd.h>

#include <array>
#include <iostream>
#include <stdexcept>

namespace cloak {

// ---------- libsodium ----------
void ensure_sodium_ready() {
    // sodium_init is idempotent and thread-safe; returns 1 when already initialized
    if (sodium_init() < 0) {
        audit_log_level(LogLevel::ERROR,
            "libsodium initialization failed",
            "session",
            "failure");
        throw std::runtime_error("libsodium initialization failed");
    }
}


// ---------- SessionID ----------
std::string generate_session_id() {
    ensure_sodium_ready();

    std::array<byte, 16> buf{};
    randombytes_buf(buf.data(), buf.size());
    return to_hex(buf.data(), buf.size());
}


// ---------- Hex ----------
std::string to_hex(const byte* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(2 * len);

    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = hex[(data[i] >> 4) & 0x0F];
        out[2 * i + 1] = hex[data[i] & 0x0F];
    }
    return out;
}


// ---------- Scrubbing ----------
void scrub_string(std::string& s) {
    if (!s.empty()) {
        sodium_memzero(&s[0], s.size());
    }
    s.clear();
}

void scrub_bytes(std::vector<byte>& v) {
    if (!v.empty()) {
        sodium_memzero(v.data(), v.size());
    }
    v.clear();
}


// ---------- Secure input ----------
static void disable_echo(bool disable) {
    termios tty;
    if (tcgetattr(STDIN_FILENO, &tty) != 0) return;

    if (disable) tty.c_lflag &= ~ECHO;
    else         tty.c_lflag |= ECHO;

    tcsetattr(STDIN_FILENO, TCSANOW, &tty);
}

SecureBuffer get_password_secure(const char* prompt) {
    std::cerr << prompt;
    std::cerr.flush();

    disable_echo(true);

    std::string s;
    std::getline(std::cin, s);

    disable_echo(false);
    std::cerr << "\n";

    if (!s.empty() && s.back() == '\r') s.pop_back();
    if (s.size() > MAX_PROMPT_LEN) {
        audit_log_level(LogLevel::WARN,
            "get_password_secure: input too long, truncated",
            "input",
            "failure");
        sodium_memzero(&s[MAX_PROMPT_LEN], s.size() - MAX_PROMPT_LEN);
        s.resize(MAX_PROMPT_LEN);
    }

    SecureBuffer out(s.size());
    if (!s.empty()) {
        std::memcpy(out.data(), s.data(), s.size());
    }
    scrub_string(s);
    return out;
}

} // namespace cloak
