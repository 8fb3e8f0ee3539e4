#pragma once
#include "cloak/secret.hpp"
#include "cloak/sys_env.hpp"

namespace cloak {

// Wrap an environment variable into a secret; std::nullopt when unset.
// The intermediate string is scrubbed.
template <typename S = Secret<std::string>>
std::optional<S> secret_from_env(const std::string& key, const SysEnv& env = ProcessEnv()) {
    std::optional<std::string> raw = env.get_env(key);
    if (!raw) {
        return std::nullopt;
    }
    std::optional<S> out(std::in_place, std::move(*raw));
    scrub_string(*raw);
    return out;
}

} // namespace cloak
