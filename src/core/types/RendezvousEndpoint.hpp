/**
 * @file RendezvousEndpoint.hpp
 * @brief Well-known local address shared by the leader and its followers.
 */

#pragma once

#include <filesystem>
#include <string>

namespace linkrelay::core {

/**
 * @brief Filesystem-backed local socket address of the running instance.
 *
 * Computed once per process by the endpoint resolver and never modified
 * afterwards. Every process of the same application and user resolves the
 * same value.
 */
struct RendezvousEndpoint {
    std::filesystem::path socketPath; ///< Path of the Unix domain socket artifact

    /**
     * @brief Returns the companion lock file used while claiming the endpoint.
     * @return The socket path with ".lock" appended.
     */
    [[nodiscard]] std::filesystem::path lockPath() const;

    /**
     * @brief Returns the socket path as a string.
     */
    [[nodiscard]] std::string toString() const { return socketPath.string(); }

    bool operator==(const RendezvousEndpoint& other) const = default;
};

} // namespace linkrelay::core
