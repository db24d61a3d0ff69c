#include "core/types/DeepLinkEvent.hpp"

namespace linkrelay::core {

std::string DeepLinkEvent::originToString() const {
    switch (origin) {
    case LinkOrigin::Relay:
        return "relay";
    case LinkOrigin::LaunchArguments:
        return "launch";
    default:
        return "unknown";
    }
}

} // namespace linkrelay::core
