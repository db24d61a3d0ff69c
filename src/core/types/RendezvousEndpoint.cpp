#include "core/types/RendezvousEndpoint.hpp"

namespace linkrelay::core {

std::filesystem::path RendezvousEndpoint::lockPath() const {
    auto path = socketPath;
    path += ".lock";
    return path;
}

} // namespace linkrelay::core
