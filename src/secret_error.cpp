#include "cloak/secret_error.hpp"

namespace cloak {

std::string DestructionLocation::to_string() const {
    return std::string(file) + ":" + std::to_string(line) + " in " + function;
}

static std::string no_longer_valid_message(const std::optional<DestructionLocation>& location) {
    std::string msg = "This secret value is no longer valid";
    if (location) {
        msg += ", destroyed at " + location->to_string();
    }
    return msg;
}

SecretNoLongerValid::SecretNoLongerValid(std::optional<DestructionLocation> location)
    : std::runtime_error(no_longer_valid_message(location)),
      location_(location)
{
}

} // namespace cloak
