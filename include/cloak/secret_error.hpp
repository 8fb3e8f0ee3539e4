#pragma once
#include "cloak/cloak_common.hpp"

#include <optional>
#include <stdexcept>

namespace cloak {

// Call site of the first destroy() on a secret.
struct DestructionLocation {
    const char* file = "";
    int line = 0;
    const char* function = "";

    // Default arguments resolve to the caller's location (GCC/Clang builtins).
    static DestructionLocation current(
        const char* file = __builtin_FILE(),
        int line = __builtin_LINE(),
        const char* function = __builtin_FUNCTION()) noexcept
    {
        DestructionLocation loc;
        loc.file = file;
        loc.line = line;
        loc.function = function;
        return loc;
    }

    std::string to_string() const;
};

// Raised by every access attempt on a destroyed secret.
class SecretNoLongerValid : public std::runtime_error {
public:
    explicit SecretNoLongerValid(std::optional<DestructionLocation> location = std::nullopt);

    const std::optional<DestructionLocation>& location() const noexcept { return location_; }

private:
    std::optional<DestructionLocation> location_;
};

} // namespace cloak
