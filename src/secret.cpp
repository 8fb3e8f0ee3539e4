#include "cloak/secret.hpp"
#include "cloak/config.hpp"
#include "cloak/logging.hpp"

namespace cloak {
namespace detail {

static const char* kind_str(SecretKind kind) {
    return kind == SecretKind::OneShot ? "one_shot_secret" : "secret";
}

bool collect_destruction_location() noexcept {
    try {
        return config().collect_destruction_location;
    }
    catch (const std::exception&) {
        return false;
    }
}

void log_secret_destroyed(SecretKind kind, const std::optional<DestructionLocation>& loc) noexcept {
    try {
        std::string entry = "Secret destroyed";
        if (loc) {
            entry += " at " + loc->to_string();
        }
        audit_log_level(LogLevel::INFO, entry, kind_str(kind), "success");
    }
    catch (const std::exception& e) {
        std::fprintf(stderr, "[audit-fail] INFO: Secret destroyed (%s)\n", e.what());
    }
}

void log_access_denied(SecretKind kind, const std::optional<DestructionLocation>& loc) {
    std::string entry = "Access attempt on destroyed secret";
    if (loc) {
        entry += " (destroyed at " + loc->to_string() + ")";
    }
    audit_log_level(LogLevel::WARN, entry, kind_str(kind), "denied");
}

} // namespace detail
} // namespace cloak
