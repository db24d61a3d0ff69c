/**
 * @file InstanceRole.hpp
 * @brief Role and probe classification enumerations.
 *
 * This file defines the role a process takes during single-instance
 * coordination and the classification of a rendezvous probe.
 */

#pragma once

#include <string>

namespace linkrelay::core {

/**
 * @brief Role of this process, decided once at startup.
 */
enum class InstanceRole {
    Leader,  ///< Owns the rendezvous endpoint and serves relayed links
    Follower ///< Relayed its arguments to the leader and must exit
};

/**
 * @brief Outcome of probing the rendezvous endpoint.
 */
enum class ProbeResult {
    Alive, ///< A leader accepted the connection
    Stale, ///< The artifact exists but nothing is listening
    Absent ///< No artifact exists
};

/**
 * @brief Converts an InstanceRole to its lowercase name.
 * @param role The role to convert.
 * @return "leader" or "follower".
 */
[[nodiscard]] std::string roleToString(InstanceRole role);

/**
 * @brief Converts a ProbeResult to its lowercase name.
 * @param result The probe result to convert.
 * @return "alive", "stale" or "absent".
 */
[[nodiscard]] std::string probeResultToString(ProbeResult result);

} // namespace linkrelay::core
