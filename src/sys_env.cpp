#include "cloak/sys_env.hpp"

#include <utility>

namespace cloak {

std::optional<std::string> ProcessEnv::get_env(const std::string& key) const {
    const char* v = std::getenv(key.c_str());
    if (!v) {
        return std::nullopt;
    }
    return std::string(v);
}

MapEnv::MapEnv(std::map<std::string, std::string> values)
    : values_(std::move(values))
{
}

std::optional<std::string> MapEnv::get_env(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace cloak
