#pragma once
#include "cloak/cloak_common.hpp"

#include <optional>

namespace cloak {

// -------- Logging (levels) --------
enum class LogLevel { INFO, WARN, ERROR, ALERT }; // levels

struct LogContext {
    std::string userId;
    std::string sessionId;
};

extern LogContext g_log_ctx;

// Initialize global logging context
void init_log_context();

const char* log_level_str(LogLevel lvl);

// Case-insensitive "info" / "warn" / "error" / "alert"
std::optional<LogLevel> parse_log_level(const std::string& s);

// Log with level, message, optional event + outcome
// audit_log_level(LogLevel::INFO, "Secret destroyed", "secret", "success");
// Never pass secret material in any of the fields.
void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event = "",
    const std::string& outcome = ""
);

} // namespace cloak
