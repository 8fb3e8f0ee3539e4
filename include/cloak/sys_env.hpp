#pragma once
#include "cloak/cloak_common.hpp"

#include <map>
#include <optional>

namespace cloak {

// -------- Environment access --------
class SysEnv {
public:
    virtual ~SysEnv() = default;
    virtual std::optional<std::string> get_env(const std::string& key) const = 0;
};

// Reads the process environment
class ProcessEnv : public SysEnv {
public:
    std::optional<std::string> get_env(const std::string& key) const override;
};

// Fixed key/value set, used by tests and embedders
class MapEnv : public SysEnv {
public:
    MapEnv() = default;
    explicit MapEnv(std::map<std::string, std::string> values);

    std::optional<std::string> get_env(const std::string& key) const override;

private:
    std::map<std::string, std::string> values_;
};

} // namespace cloak
