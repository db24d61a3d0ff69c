#include "core/types/InstanceRole.hpp"

namespace linkrelay::core {

std::string roleToString(InstanceRole role) {
    switch (role) {
    case InstanceRole::Leader:
        return "leader";
    case InstanceRole::Follower:
        return "follower";
    default:
        return "unknown";
    }
}

std::string probeResultToString(ProbeResult result) {
    switch (result) {
    case ProbeResult::Alive:
        return "alive";
    case ProbeResult::Stale:
        return "stale";
    case ProbeResult::Absent:
        return "absent";
    default:
        return "unknown";
    }
}

} // namespace linkrelay::core
