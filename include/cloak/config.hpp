#pragma once
#include "cloak/cloak_common.hpp"
#include "cloak/logging.hpp"
#include "cloak/sys_env.hpp"

namespace cloak {

// -------- Runtime configuration --------
struct Config {
    std::string audit_log_path;                 // empty: log to stderr
    LogLevel min_log_level = LogLevel::WARN;
    bool collect_destruction_location = true;
};

// Build a Config from CLOAK_* variables; unparsable values keep the default.
Config load_config(const SysEnv& env);

// Process-wide config
Config config();
void set_config(const Config& cfg);

std::optional<bool> parse_bool_flag(const std::string& s);

} // namespace cloak
