#include "cloak/logging.hpp"
#include "cloak/config.hpp"
#include "cloak/util.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <pwd.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <mutex>

namespace cloak {

LogContext g_log_ctx;

static std::mutex g_log_mutex;


// ---------------- Get username ----------------
static std::string get_system_username() {
    uid_t uid = geteuid();
    struct passwd* pw = getpwuid(uid);
    if (pw && pw->pw_name) {
        return std::string(pw->pw_name);
    }
    const char* envUser = std::getenv("USER");
    if (envUser && *envUser) {
        return std::string(envUser);
    }
    return "unknown";
}


// ---------------- Global logging context init ----------------
void init_log_context() {
    // generate_session_id may itself log, so resolve before locking
    std::string user = get_system_username();
    std::string session = generate_session_id();

    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_ctx.userId = user;
    g_log_ctx.sessionId = session;
}


// ---------------- Logging (levels) ----------------
const char* log_level_str(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::ALERT: return "ALERT";
    default:              return "UNKNOWN";
    }
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "info")  return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "alert") return LogLevel::ALERT;
    return std::nullopt;
}

void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event,
    const std::string& outcome
)
{
    const Config cfg = config();
    if (static_cast<int>(lvl) < static_cast<int>(cfg.min_log_level)) {
        return;
    }

    // timestamp
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    char tbuf[64];
    if (std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        std::strncpy(tbuf, "0000-00-00 00:00:00", sizeof(tbuf));
        tbuf[sizeof(tbuf) - 1] = '\0';
    }

    // sanitize message fields to avoid newlines in log entries
    auto sanitize = [](const std::string& s) {
        std::string r = s;
        for (char& c : r) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        return r;
        };

    std::string s_entry = sanitize(entry);
    std::string s_event = sanitize(event);
    std::string s_outcome = sanitize(outcome);

    std::lock_guard<std::mutex> lock(g_log_mutex);

    FILE* f = stderr;
    bool owned = false;
    if (!cfg.audit_log_path.empty()) {
        f = std::fopen(cfg.audit_log_path.c_str(), "a");
        if (!f) {
            std::fprintf(stderr, "[audit-fail] %s: %s\n",
                log_level_str(lvl),
                s_entry.c_str());
            return;
        }
        owned = true;
        fchmod(fileno(f), S_IRUSR | S_IWUSR);
    }

    // timestamp | level | user | session | event | outcome | message
    std::fprintf(
        f,
        "%s | %s | user=%s | session=%s | event=%s | outcome=%s | %s\n",
        tbuf,
        log_level_str(lvl),
        g_log_ctx.userId.c_str(),
        g_log_ctx.sessionId.c_str(),
        s_event.c_str(),
        s_outcome.c_str(),
        s_entry.c_str()
    );

    std::fflush(f);
    if (owned) {
        fsync(fileno(f));
        std::fclose(f);
    }
}

} // namespace cloak
