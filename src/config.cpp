#include "cloak/config.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace cloak {

static std::mutex g_config_mutex;
static Config g_config;

std::optional<bool> parse_bool_flag(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

Config load_config(const SysEnv& env) {
    Config cfg;

    if (auto path = env.get_env(ENV_AUDIT_LOG)) {
        cfg.audit_log_path = *path;
    }

    if (auto lvl = env.get_env(ENV_LOG_LEVEL)) {
        if (auto parsed = parse_log_level(*lvl)) {
            cfg.min_log_level = *parsed;
        }
        else {
            audit_log_level(LogLevel::WARN,
                std::string("load_config: unknown ") + ENV_LOG_LEVEL + " value, keeping default",
                "config",
                "failure");
        }
    }

    if (auto flag = env.get_env(ENV_COLLECT_LOCATION)) {
        if (auto parsed = parse_bool_flag(*flag)) {
            cfg.collect_destruction_location = *parsed;
        }
        else {
            audit_log_level(LogLevel::WARN,
                std::string("load_config: unknown ") + ENV_COLLECT_LOCATION + " value, keeping default",
                "config",
                "failure");
        }
    }

    return cfg;
}

Config config() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    return g_config;
}

void set_config(const Config& cfg) {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    g_config = cfg;
}

} // namespace cloak
